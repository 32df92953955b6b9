# if !defined( __logos_references_strongs_hpp__ )
# define __logos_references_strongs_hpp__
# include <string_view>
# include <stdexcept>
# include <string>

namespace logos {
namespace references {

  class InvalidStrongsNumber: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

 /*
  * NormalizeStrongsNumber( ... )
  *
  * Converts Strong's concordance number to canonical form: 'g 0025' -> 'G25',
  * 'H0001' -> 'H1', 'G000' -> 'G0'.
  */
  bool  NormalizeStrongsNumber( std::string&, const std::string_view& );
  auto  NormalizeStrongsNumber( const std::string_view& ) -> std::string;

  inline
  bool  NormalizeStrongsNumber( std::string& out, const char* str )
    {  return str != nullptr && NormalizeStrongsNumber( out, std::string_view( str ) );  }
  inline
  auto  NormalizeStrongsNumber( const char* str ) -> std::string
    {  return NormalizeStrongsNumber( std::string_view( str != nullptr ? str : "" ) );  }
  inline
  auto  NormalizeStrongsNumber( const std::string& str ) -> std::string
    {  return NormalizeStrongsNumber( std::string_view( str ) );  }

  inline
  bool  IsValidStrongsNumber( const std::string_view& str )
    {  std::string  s;  return NormalizeStrongsNumber( s, str );  }

}}

# endif   // !__logos_references_strongs_hpp__
