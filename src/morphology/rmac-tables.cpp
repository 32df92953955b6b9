# include "rmac-tables.hpp"
# include <algorithm>
# include <iterator>

namespace logos {
namespace morphology {

  // sorted by code

  constexpr CodeName  partsOfSpeech[] =
  {
    { "A",    "Adjective" },
    { "ADV",  "Adverb" },
    { "ARAM", "Aramaic" },
    { "C",    "ReciprocalPronoun" },
    { "CONJ", "Conjunction" },
    { "D",    "DemonstrativePronoun" },
    { "F",    "ReflexivePronoun" },
    { "HEB",  "Hebrew" },
    { "I",    "InterrogativePronoun" },
    { "INJ",  "Interjection" },
    { "K",    "CorrelativePronoun" },
    { "N",    "Noun" },
    { "P",    "PersonalPronoun" },
    { "PREP", "Preposition" },
    { "PRT",  "Particle" },
    { "Q",    "CorrelativeAdjective" },
    { "R",    "RelativePronoun" },
    { "S",    "PossessivePronoun" },
    { "T",    "Article" },
    { "V",    "Verb" },
    { "X",    "IndefinitePronoun" }
  };

  constexpr CodeName  tenses[] =
  {
    { "2A", "SecondAorist" },
    { "2F", "SecondFuture" },
    { "2I", "SecondImperfect" },
    { "2L", "SecondPluperfect" },
    { "2P", "SecondPresent" },
    { "2R", "SecondPerfect" },
    { "A",  "Aorist" },
    { "F",  "Future" },
    { "I",  "Imperfect" },
    { "L",  "Pluperfect" },
    { "P",  "Present" },
    { "R",  "Perfect" }
  };

  constexpr CodeName  flagNames[] =
  {
    { "A",   "Accusative" },
    { "C",   "Comparative" },
    { "D",   "Dative" },
    { "G",   "Genitive" },
    { "I",   "Interrogative" },
    { "K",   "Krasis" },
    { "L",   "Location" },
    { "LG",  "LocationGentilic" },
    { "LI",  "LetterIndeclinable" },
    { "N",   "Negative" },
    { "NUI", "IndeclinableNumber" },
    { "P",   "ProperName" },
    { "PG",  "PersonGentilic" },
    { "S",   "Superlative" },
    { "T",   "Title" }
  };

  constexpr std::string_view  simpleTypes[] =
  {
    "ARAM", "CONJ", "HEB", "INJ", "PREP", "PRT"
  };

  constexpr auto  KeyOf( const CodeName& entry ) -> std::string_view  {  return entry.code;  }
  constexpr auto  KeyOf( const std::string_view& entry ) -> std::string_view  {  return entry;  }

  template <class T, size_t N>
  constexpr bool  IsStrictlySorted( const T (&table)[N] )
  {
    for ( size_t i = 1; i < N; ++i )
      if ( !(KeyOf( table[i - 1] ) < KeyOf( table[i] )) )
        return false;
    return true;
  }

  static_assert( IsStrictlySorted( partsOfSpeech ), "parts of speech have to be sorted by code" );
  static_assert( IsStrictlySorted( tenses ), "tenses have to be sorted by code" );
  static_assert( IsStrictlySorted( flagNames ), "flags have to be sorted by code" );
  static_assert( IsStrictlySorted( simpleTypes ), "simple types have to be sorted" );

  template <size_t N>
  auto  Search( const CodeName (&table)[N], const std::string_view& key ) -> const char*
  {
    auto  pfound = std::lower_bound( std::begin( table ), std::end( table ), key,
      []( const CodeName& entry, const std::string_view& k ){  return std::string_view( entry.code ) < k;  } );

    return pfound != std::end( table ) && std::string_view( pfound->code ) == key ? pfound->name : nullptr;
  }

  auto  GetPartOfSpeech( const std::string_view& key ) -> const char*
  {
    return Search( partsOfSpeech, key );
  }

  auto  GetTense( const std::string_view& key ) -> const char*
  {
    return Search( tenses, key );
  }

  auto  GetFlag( const std::string_view& key ) -> const char*
  {
    return Search( flagNames, key );
  }

  auto  GetCase( char ch ) -> const char*
  {
    switch ( ch )
    {
      case 'A': return "Accusative";
      case 'D': return "Dative";
      case 'G': return "Genitive";
      case 'N': return "Nominative";
      case 'V': return "Vocative";
      default:  return nullptr;
    }
  }

  auto  GetNumber( char ch ) -> const char*
  {
    return ch == 'S' ? "Singular" :
           ch == 'P' ? "Plural" : nullptr;
  }

  auto  GetGender( char ch ) -> const char*
  {
    return ch == 'M' ? "Masculine" :
           ch == 'F' ? "Feminine" :
           ch == 'N' ? "Neuter" : nullptr;
  }

  auto  GetPerson( char ch ) -> const char*
  {
    return ch == '1' ? "First" :
           ch == '2' ? "Second" :
           ch == '3' ? Names::third : nullptr;
  }

  auto  GetVoice( char ch ) -> const char*
  {
    switch ( ch )
    {
      case 'A': return "Active";
      case 'M': return "Middle";
      case 'P': return "Passive";
      case 'E': return "MiddleOrPassive";
      case 'D': return Names::deponent;
      case 'N': return "MiddleOrPassiveDeponent";
      case 'O': return "PassiveDeponent";
      default:  return nullptr;
    }
  }

  auto  GetFiniteMood( char ch ) -> const char*
  {
    switch ( ch )
    {
      case 'I': return "Indicative";
      case 'S': return "Subjunctive";
      case 'M': return "Imperative";
      case 'O': return "Optative";
      default:  return nullptr;
    }
  }

  auto  GetVerbForm( char ch ) -> const char*
  {
    return ch == 'N' ? Names::infinitive :
           ch == 'P' ? Names::participle : Names::finite;
  }

  bool  IsSimpleType( const std::string_view& key )
  {
    return std::binary_search( std::begin( simpleTypes ), std::end( simpleTypes ), key );
  }

  bool  IsDeponentVoice( char ch )
  {
    return ch == 'D' || ch == 'N' || ch == 'O';
  }

  auto  PartOfSpeechTable() -> CodeTable  {  return { std::begin( partsOfSpeech ), std::end( partsOfSpeech ) };  }
  auto  TenseTable() -> CodeTable         {  return { std::begin( tenses ), std::end( tenses ) };  }
  auto  FlagTable() -> CodeTable          {  return { std::begin( flagNames ), std::end( flagNames ) };  }

}}
