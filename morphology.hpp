# if !defined( __logos_morphology_hpp__ )
# define __logos_morphology_hpp__
# include <cstring>
# include <vector>

namespace logos {

 /*
  * MorphologyInfo
  *
  * Decoded grammatical descriptor of a single word.  All the names are static
  * strings from the decoder tables, nullptr means 'not set'.
  *
  * The object is never modified in place: Set*() and AddFlag() return modified
  * copies.
  */
  class MorphologyInfo
  {
  public:
    auto  GetPos() const -> const char*       {  return pos;  }
    auto  GetTense() const -> const char*     {  return tense;  }
    auto  GetVoice() const -> const char*     {  return voice;  }
    auto  GetVerbForm() const -> const char*  {  return verbForm;  }
    auto  GetMood() const -> const char*      {  return mood;  }
    auto  GetCase() const -> const char*      {  return grCase;  }
    auto  GetNumber() const -> const char*    {  return number;  }
    auto  GetGender() const -> const char*    {  return gender;  }
    auto  GetPerson() const -> const char*    {  return person;  }
    auto  GetFlags() const -> const std::vector<const char*>&  {  return flags;  }

    bool  HasFlag( const char* ) const;
    bool  defined() const {  return pos != nullptr;  }

  public:
    auto  SetPos( const char* s ) const -> MorphologyInfo       {  return Set( &MorphologyInfo::pos, s );  }
    auto  SetTense( const char* s ) const -> MorphologyInfo     {  return Set( &MorphologyInfo::tense, s );  }
    auto  SetVoice( const char* s ) const -> MorphologyInfo     {  return Set( &MorphologyInfo::voice, s );  }
    auto  SetVerbForm( const char* s ) const -> MorphologyInfo  {  return Set( &MorphologyInfo::verbForm, s );  }
    auto  SetMood( const char* s ) const -> MorphologyInfo      {  return Set( &MorphologyInfo::mood, s );  }
    auto  SetCase( const char* s ) const -> MorphologyInfo      {  return Set( &MorphologyInfo::grCase, s );  }
    auto  SetNumber( const char* s ) const -> MorphologyInfo    {  return Set( &MorphologyInfo::number, s );  }
    auto  SetGender( const char* s ) const -> MorphologyInfo    {  return Set( &MorphologyInfo::gender, s );  }
    auto  SetPerson( const char* s ) const -> MorphologyInfo    {  return Set( &MorphologyInfo::person, s );  }
    auto  AddFlag( const char* ) const -> MorphologyInfo;

  public:
    bool  operator == ( const MorphologyInfo& ) const;
    bool  operator != ( const MorphologyInfo& m ) const {  return !(*this == m);  }

  private:
    auto  Set( const char* MorphologyInfo::*, const char* ) const -> MorphologyInfo;

  private:
    const char*               pos = nullptr;
    const char*               tense = nullptr;
    const char*               voice = nullptr;
    const char*               verbForm = nullptr;
    const char*               mood = nullptr;
    const char*               grCase = nullptr;
    const char*               number = nullptr;
    const char*               gender = nullptr;
    const char*               person = nullptr;
    std::vector<const char*>  flags;

  };

  // MorphologyInfo inline implementation

  inline
  bool  MorphologyInfo::HasFlag( const char* name ) const
  {
    for ( auto& next: flags )
      if ( name != nullptr && strcmp( next, name ) == 0 )
        return true;
    return false;
  }

  inline
  auto  MorphologyInfo::AddFlag( const char* name ) const -> MorphologyInfo
  {
    auto  morph( *this );

    if ( name != nullptr )
      morph.flags.push_back( name );
    return morph;
  }

  inline
  auto  MorphologyInfo::Set( const char* MorphologyInfo::* field, const char* value ) const -> MorphologyInfo
  {
    auto  morph( *this );

    return morph.*field = value, morph;
  }

  inline
  bool  MorphologyInfo::operator == ( const MorphologyInfo& m ) const
  {
    auto  equals = []( const char* a, const char* b )
      {  return a == b || (a != nullptr && b != nullptr && strcmp( a, b ) == 0);  };

    if ( flags.size() != m.flags.size() )
      return false;

    for ( size_t i = 0; i != flags.size(); ++i )
      if ( !equals( flags[i], m.flags[i] ) )
        return false;

    return equals( pos, m.pos )
        && equals( tense, m.tense )
        && equals( voice, m.voice )
        && equals( verbForm, m.verbForm )
        && equals( mood, m.mood )
        && equals( grCase, m.grCase )
        && equals( number, m.number )
        && equals( gender, m.gender )
        && equals( person, m.person );
  }

}

# endif   // !__logos_morphology_hpp__
