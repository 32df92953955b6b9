# include "../../morphology/rmac.hpp"
# include "rmac-tables.hpp"
# include "../text-scan.hpp"
# include <algorithm>
# include <iterator>
# include <vector>

namespace logos {
namespace morphology {

  using Segments = std::vector<std::string_view>;

  auto  Split( const std::string_view& code ) -> Segments
  {
    auto  output = Segments();

    for ( size_t ntop = 0; ; )
    {
      auto  nend = code.find( '-', ntop );

      if ( nend == std::string_view::npos )
        return output.push_back( code.substr( ntop ) ), output;

      output.push_back( code.substr( ntop, nend - ntop ) );
      ntop = nend + 1;
    }
  }

  inline  char  GetChar( const std::string_view& s, size_t n )
  {
    return n < s.size() ? s[n] : '\0';
  }

 /*
  * Case, number and gender triplet; each character is optional
  */
  auto  SetCaseNumberGender( const MorphologyInfo& morph, const std::string_view& cng ) -> MorphologyInfo
  {
    return morph
      .SetCase( GetCase( GetChar( cng, 0 ) ) )
      .SetNumber( GetNumber( GetChar( cng, 1 ) ) )
      .SetGender( GetGender( GetChar( cng, 2 ) ) );
  }

  auto  SetPersonNumber( const MorphologyInfo& morph, const std::string_view& pn ) -> MorphologyInfo
  {
    return morph
      .SetPerson( GetPerson( GetChar( pn, 0 ) ) )
      .SetNumber( GetNumber( GetChar( pn, 1 ) ) );
  }

  auto  GetSuffixFlag( const Segments& parts, size_t index ) -> const char*
  {
    return index < parts.size() ? GetFlag( parts[index] ) : nullptr;
  }

  // CONJ, PREP, INJ, CONJ-T ...
  bool  ParseSimpleType( MorphologyInfo& morph, const Segments& parts )
  {
    if ( !IsSimpleType( parts.front() ) )
      return false;

    morph = MorphologyInfo()
      .SetPos( GetPartOfSpeech( parts.front() ) )
      .AddFlag( GetSuffixFlag( parts, 1 ) );
    return true;
  }

  // ADV, ADV-C, ADV-I ...
  bool  ParseAdverb( MorphologyInfo& morph, const Segments& parts )
  {
    morph = MorphologyInfo()
      .SetPos( Names::adverb )
      .AddFlag( GetSuffixFlag( parts, 1 ) );
    return true;
  }

 /*
  * ParseVerb()
  *
  * V-TVM[-PN], V-TVN, V-TVP[-CNG] where T is the tense, 1 or 2 characters
  * for secondary tenses ('2A' for second aorist), V is the voice and M is
  * the mood or the verb form.
  */
  bool  ParseVerb( MorphologyInfo& morph, const Segments& parts )
  {
    auto    modifiers = parts.size() >= 2 ? parts[1] : std::string_view();
    size_t  voiceIndex;
    char    voiceChar;
    char    moodChar;

    if ( modifiers.size() < 3 )
      return false;

    voiceIndex = modifiers[0] == '2' && modifiers.size() >= 4 ? 2 : 1;
    voiceChar = modifiers[voiceIndex];
    moodChar = modifiers[voiceIndex + 1];

    auto  verb = MorphologyInfo()
      .SetPos( Names::verb )
      .SetTense( GetTense( modifiers.substr( 0, voiceIndex ) ) )
      .SetVoice( GetVoice( voiceChar ) )
      .SetVerbForm( GetVerbForm( moodChar ) );

    if ( IsDeponentVoice( voiceChar ) )
      verb = verb.AddFlag( Names::deponent );

    if ( moodChar == 'N' )
      return morph = verb, true;

    if ( moodChar == 'P' )
    {
      morph = parts.size() >= 3 ? SetCaseNumberGender( verb, parts[2] ) : verb;
      return true;
    }

    verb = verb.SetMood( GetFiniteMood( moodChar ) );

    morph = parts.size() >= 3 ? SetPersonNumber( verb, parts[2] ) : verb;
    return true;
  }

 /*
  * ParsePersonal()
  *
  * P-PC[N][-F] for the first and second persons which have no gender,
  * P-C[N][G][-F] for the third person
  */
  bool  ParsePersonal( MorphologyInfo& morph, const Segments& parts )
  {
    auto  modifiers = parts.size() >= 2 ? parts[1] : std::string_view();
    auto  pronoun = MorphologyInfo().SetPos( Names::personal );
    auto  sperson = (const char*)nullptr;

    if ( modifiers.size() < 2 )
      return false;

    if ( (sperson = GetPerson( modifiers[0] )) != nullptr )
    {
      pronoun = pronoun
        .SetPerson( sperson )
        .SetCase( GetCase( GetChar( modifiers, 1 ) ) )
        .SetNumber( GetNumber( GetChar( modifiers, 2 ) ) );
    }
      else
    {
      pronoun = SetCaseNumberGender( pronoun.SetPerson( Names::third ), modifiers );
    }

    morph = pronoun.AddFlag( GetSuffixFlag( parts, 2 ) );
    return true;
  }

  // N-GSM-P, A-NSM-C, T-ASF ...
  bool  ParseNominal( MorphologyInfo& morph, const Segments& parts )
  {
    const char* partOfSpeech;

    if ( parts.size() < 2 )
      return false;

    if ( (partOfSpeech = GetPartOfSpeech( parts[0] )) == nullptr )
      return false;

    morph = SetCaseNumberGender( MorphologyInfo().SetPos( partOfSpeech ), parts[1] )
      .AddFlag( GetSuffixFlag( parts, 2 ) );
    return true;
  }

  bool  ParseRmac( MorphologyInfo& morph, const char* str, size_t len )
  {
    auto  scode = std::string();
    auto  parts = Segments();

    if ( str == nullptr )
      return false;

    if ( len == (size_t)-1 )
      len = strlen( str );

  // trim spaces, unicode ones too
    auto  wscode = codepages::mbcstowide( codepages::codepage_utf8, str, len );
    auto  ptrtop = SkipSpace( wscode.c_str(), wscode.c_str() + wscode.size() );
    auto  ptrend = wscode.c_str() + wscode.size();

    while ( ptrend != ptrtop && IsSpace( ptrend[-1] ) )
      --ptrend;

    if ( ptrtop == ptrend )
      return false;

  // make uppercase code and split it by '-'; non-ascii characters never match
    std::transform( ptrtop, ptrend, std::back_inserter( scode ), ToUpper );

    parts = Split( scode );

    if ( ParseSimpleType( morph, parts ) )
      return true;

    if ( scode.compare( 0, 3, "ADV" ) == 0 )
      return ParseAdverb( morph, parts );

    if ( scode.compare( 0, 2, "V-" ) == 0 )
      return ParseVerb( morph, parts );

    if ( scode.compare( 0, 2, "P-" ) == 0 )
      return ParsePersonal( morph, parts );

    return ParseNominal( morph, parts );
  }

}}
