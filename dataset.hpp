# if !defined( __logos_dataset_hpp__ )
# define __logos_dataset_hpp__
# include <mtc/zmap.h>
# include <unordered_map>
# include <string_view>
# include <stdexcept>
# include <memory>
# include <string>
# include <vector>

namespace logos {

  class DataError: public std::runtime_error {  using std::runtime_error::runtime_error;  };

  struct TokenData
  {
    std::string gloss;
    std::string greek;
    std::string translit;
    std::string strongs;
    std::string rmac;
    std::string rmacDesc;
    std::string strongDef;
    bool        hasRmacDesc = false;
    bool        hasStrongDef = false;
  };

  struct VerseData
  {
    std::vector<TokenData>  tokens;
  };

  using VerseMap = std::unordered_map<std::string, VerseData>;
  using LexiconMap = std::unordered_map<std::string, std::string>;

 /*
  * BibleData
  *
  * Read-only verse and lexicon collections.  Copies share the same data, and
  * the data never changes after load, so the object may be used from any
  * thread without locks.
  */
  class BibleData
  {
    struct impl;

    std::shared_ptr<const impl> data;

    friend  BibleData LoadBibleData( VerseMap&&, LexiconMap&& );

  public:
    auto  GetVerse( const std::string_view& ) const -> const VerseData*;
    auto  GetDefinition( const std::string_view& ) const -> const std::string*;
    auto  VersesCount() const -> size_t;
    auto  LexiconCount() const -> size_t;
    bool  IsInitialized() const {  return data != nullptr;  }
  };

 /*
  * Loaders of the parsed documents:
  *
  *   verses:   { "Matt.1.1": { "tokens": [ { "gloss": ..., "greek": ..., "translit": ...,
  *               "strongs": ..., "rmac": ..., "rmac_desc": ..., "strong_def": ... } ] } }
  *   lexicon:  { "G976": "definition" }
  *
  * Token property names are case-insensitive; 'rmac_desc' and 'strong_def' are optional.
  */
  auto  LoadVerses( const mtc::zmap& ) -> VerseMap;                     // throws DataError
  auto  LoadLexicon( const mtc::zmap& ) -> LexiconMap;                  // throws DataError
  auto  LoadBibleData( VerseMap&&, LexiconMap&& ) -> BibleData;
  auto  LoadBibleData( const mtc::zmap&, const mtc::zmap& ) -> BibleData; // throws DataError

  auto  LoadJsonFile( const char* ) -> mtc::zmap;                       // throws DataError, file_error
  auto  OpenBibleData( const char* verses, const char* lexicon ) -> BibleData;

  inline
  auto  OpenBibleData( const std::string& verses, const std::string& lexicon ) -> BibleData
    {  return OpenBibleData( verses.c_str(), lexicon.c_str() );  }

}

# endif   // !__logos_dataset_hpp__
