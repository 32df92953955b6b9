# if !defined( __logos_utils_print_json_hpp__ )
# define __logos_utils_print_json_hpp__
# include "../compat.hpp"
# include <mtc/json.h>
# include <cerrno>

template <> inline
int*  Serialize( int* pfd, const void* pv, size_t cc )
{
  auto  beg = (const char*)pv;
  auto  end = beg + cc;
  int   cch;

  while ( pfd != nullptr && beg != end )
  {
    if ( (cch = write( *pfd, beg, end - beg )) > 0 )  beg += cch;
      else
    if ( cch == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) )  return nullptr;
  }
  return pfd;
}

// prints the document to stdout followed by a newline
inline  bool  PrintJson( const mtc::zmap& zvalue, bool compact )
{
  int   handle = 1;
  auto  output = compact ?
    mtc::json::Print( &handle, zvalue ) :
    mtc::json::Print( &handle, zvalue, mtc::json::print::decorated() );

  return output != nullptr && ::Serialize( output, "\n", 1 ) != nullptr;
}

# endif   // !__logos_utils_print_json_hpp__
