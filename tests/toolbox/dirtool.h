# if !defined( __logos_tests_toolbox_dirtool_h__ )
# define __logos_tests_toolbox_dirtool_h__
# include <string>

void  RemoveFiles( const char* path );
void  WriteTextFile( const char* path, const char* text );

inline  void  RemoveFiles( const std::string& path )  {  return RemoveFiles( path.c_str() );  }
inline  void  WriteTextFile( const std::string& path, const char* text )  {  return WriteTextFile( path.c_str(), text );  }

# endif // !__logos_tests_toolbox_dirtool_h__
