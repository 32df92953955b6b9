# if !defined( __logos_compat_hpp__ )
# define __logos_compat_hpp__

# if !defined( LINE_STRING )
#   define __LN_STRING( arg )  #arg
#   define _LN__STRING( arg )  __LN_STRING( arg )
#   define LINE_STRING _LN__STRING(__LINE__)
# endif   // !LINE_STRING

# if defined( _WIN32 ) || defined( _WIN64 )
#   include <io.h>
#   define open _open
#   define write _write
#   define close _close
# else
#   include <unistd.h>
# endif

# endif   // !__logos_compat_hpp__
