# if !defined( __logos_utils_read_line_hpp__ )
# define __logos_utils_read_line_hpp__
# include <cstring>
# include <cstdio>
# include <string>

/*
 * ReadLine( source, output )
 *
 * Reads the whole next line of any length without the trailing '\r' and '\n'.
 * Returns false at the end of input.
 */
inline  bool  ReadLine( FILE* source, std::string& output )
{
  char  buffer[0x400];
  bool  hasany = false;

  for ( output.clear(); fgets( buffer, sizeof(buffer), source ) != nullptr; )
  {
    auto  length = strlen( buffer );

    hasany = true;

    if ( length != 0 && buffer[length - 1] == '\n' )
    {
      output.append( buffer, length - 1 );
      break;
    }
    output.append( buffer, length );
  }
  while ( !output.empty() && output.back() == '\r' )
    output.pop_back();

  return hasany;
}

# endif   // !__logos_utils_read_line_hpp__
