# if !defined( __logos_src_text_scan_hpp__ )
# define __logos_src_text_scan_hpp__
# include <moonycode/chartype.h>
# include <moonycode/codes.h>
# include <mtc/wcsstr.h>

namespace logos {

  // unicode spaces are spaces too
  inline  bool  IsSpace( widechar c )
  {
    return c < 0x80 ? (c == ' ' || (c >= 0x09 && c <= 0x0d)) :
      (codepages::charType[c] & 0xf0) == codepages::cat_Z;
  }

  inline  bool  IsDigit( widechar c ) {  return c >= '0' && c <= '9';  }
  inline  bool  IsLatin( widechar c ) {  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');  }

  // non-ascii characters become '\0'
  inline  char  ToLower( widechar c ) {  return c >= 0x80 ? '\0' : (char)(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);  }
  inline  char  ToUpper( widechar c ) {  return c >= 0x80 ? '\0' : (char)(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c);  }

  inline  auto  SkipSpace( const widechar* s, const widechar* e ) -> const widechar*
  {
    while ( s != e && IsSpace( *s ) )
      ++s;
    return s;
  }

 /*
  * Selects the sequence of digits without leading zeros; all-zero group
  * becomes '0'
  */
  inline  auto  GetNumber( std::string& out, const widechar* s, const widechar* e ) -> const widechar*
  {
    auto  top = s;

    for ( out.clear(); s != e && IsDigit( *s ); ++s )
      if ( !out.empty() || *s != '0' )
        out += (char)*s;

    if ( s != top && out.empty() )
      out = "0";
    return s;
  }

}

# endif   // !__logos_src_text_scan_hpp__
