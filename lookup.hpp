# if !defined( __logos_lookup_hpp__ )
# define __logos_lookup_hpp__
# include "morphology.hpp"
# include "dataset.hpp"
# include <mtc/zmap.h>

namespace logos {

  class EntryNotFound: public std::out_of_range {  using std::out_of_range::out_of_range;  };

  struct TokenResponse
  {
    std::string     gloss;
    std::string     greek;
    std::string     translit;
    std::string     strongs;
    std::string     rmac;
    std::string     rmacDesc;
    bool            hasRmacDesc = false;
    MorphologyInfo  morph;                  // undefined if rmac is not parsed
    std::string     strongDef;
    bool            hasStrongDef = false;
  };

  struct VerseResponse
  {
    std::string                 reference;
    std::vector<TokenResponse>  tokens;
  };

  struct VerseLookupResult
  {
    std::vector<VerseResponse>  verses;
    std::vector<std::string>    notFound;
  };

  struct LexiconEntry
  {
    std::string strongsNumber;
    std::string definition;
  };

 /*
  * LookupVerses( bible, references )
  *
  * Normalizes each reference and gets the verse with tokens enriched with the
  * decoded morphology and Strong's definitions.
  *
  * notFound lists the references failed to normalize (as passed) followed by
  * the normalized references missing in the dataset.
  */
  auto  LookupVerses( const BibleData&, const std::vector<std::string>& ) -> VerseLookupResult;
  auto  LookupToken( const BibleData&, const TokenData& ) -> TokenResponse;

 /*
  * LookupLexicon( bible, strongsNumber )
  *
  * Throws references::InvalidStrongsNumber for invalid numbers and EntryNotFound
  * for unknown ones; bool version returns false in both cases.
  */
  auto  LookupLexicon( const BibleData&, const std::string_view& ) -> LexiconEntry;
  bool  LookupLexicon( LexiconEntry&, const BibleData&, const std::string_view& );

  auto  ToZmap( const MorphologyInfo& ) -> mtc::zmap;
  auto  ToZmap( const TokenResponse& ) -> mtc::zmap;
  auto  ToZmap( const VerseResponse& ) -> mtc::zmap;
  auto  ToZmap( const VerseLookupResult& ) -> mtc::zmap;
  auto  ToZmap( const LexiconEntry& ) -> mtc::zmap;

}

# endif   // !__logos_lookup_hpp__
