# if !defined( __logos_morphology_rmac_hpp__ )
# define __logos_morphology_rmac_hpp__
# include "../morphology.hpp"
# include <string_view>
# include <string>

namespace logos {
namespace morphology {

 /*
  * ParseRmac( ... )
  *
  * Decodes Robinson's Morphological Analysis Code, i.e. 'V-PAP-NSM', 'N-GSM-P',
  * 'CONJ', 'P-1NS'.  The code is case-insensitive, leading and trailing spaces
  * are ignored.
  *
  * Never throws on invalid codes: the bool version returns false and leaves the
  * output untouched, other versions return an undefined MorphologyInfo.
  */
  bool  ParseRmac( MorphologyInfo&, const char*, size_t = (size_t)-1 );

  inline
  auto  ParseRmac( const char* str, size_t len = (size_t)-1 ) -> MorphologyInfo
    {  MorphologyInfo morph;  return ParseRmac( morph, str, len ), morph;  }
  inline
  auto  ParseRmac( const std::string_view& str ) -> MorphologyInfo
    {  return ParseRmac( str.data(), str.size() );  }
  inline
  auto  ParseRmac( const std::string& str ) -> MorphologyInfo
    {  return ParseRmac( str.c_str(), str.size() );  }

  inline
  bool  IsValidRmac( const std::string_view& str )
    {  return ParseRmac( str ).defined();  }

}}

# endif   // !__logos_morphology_rmac_hpp__
