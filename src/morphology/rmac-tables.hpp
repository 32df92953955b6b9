# if !defined( __logos_src_morphology_rmac_tables_hpp__ )
# define __logos_src_morphology_rmac_tables_hpp__
# include <string_view>

namespace logos {
namespace morphology {

  struct Names final
  {
    constexpr static  const char* verb       = "Verb";
    constexpr static  const char* adverb     = "Adverb";
    constexpr static  const char* personal   = "PersonalPronoun";

    constexpr static  const char* finite     = "Finite";
    constexpr static  const char* participle = "Participle";
    constexpr static  const char* infinitive = "Infinitive";

    constexpr static  const char* third      = "Third";
    constexpr static  const char* deponent   = "Deponent";
  };

  struct CodeName
  {
    const char* code;
    const char* name;
  };

  struct CodeTable
  {
    const CodeName* ptrtop;
    const CodeName* ptrend;

    auto  begin() const -> const CodeName*  {  return ptrtop;  }
    auto  end() const -> const CodeName*    {  return ptrend;  }
    auto  size() const -> size_t            {  return ptrend - ptrtop;  }
  };

 /*
  * String-keyed tables are sorted by code and are searched with binary search;
  * single-character tables are plain switches.
  */
  auto  GetPartOfSpeech( const std::string_view& ) -> const char*;
  auto  GetTense( const std::string_view& ) -> const char*;
  auto  GetFlag( const std::string_view& ) -> const char*;

  auto  GetCase( char ) -> const char*;
  auto  GetNumber( char ) -> const char*;
  auto  GetGender( char ) -> const char*;
  auto  GetPerson( char ) -> const char*;
  auto  GetVoice( char ) -> const char*;
  auto  GetFiniteMood( char ) -> const char*;
  auto  GetVerbForm( char ) -> const char*;

  bool  IsSimpleType( const std::string_view& );
  bool  IsDeponentVoice( char );

 /*
  * Direct table access, used to check table consistency
  */
  auto  PartOfSpeechTable() -> CodeTable;
  auto  TenseTable() -> CodeTable;
  auto  FlagTable() -> CodeTable;

}}

# endif   // !__logos_src_morphology_rmac_tables_hpp__
