# include "dirtool.h"
# include <mtc/directory.h>
# include <mtc/wcsstr.h>
# include <stdexcept>
# include <cstdio>
# include <cstring>

void  RemoveFiles( const char* path )
{
  auto  dir = mtc::directory::Open( path );

  if ( dir.defined() )
    for ( auto entry = dir.Get(); entry.defined(); entry = dir.Get() )
      remove( mtc::strprintf( "%s%s", entry.folder(), entry.string() ).c_str() );
}

void  WriteTextFile( const char* path, const char* text )
{
  auto  lpfile = fopen( path, "wb" );

  if ( lpfile == nullptr )
    throw std::runtime_error( mtc::strprintf( "could not create file '%s'", path ) );

  if ( fwrite( text, 1, strlen( text ), lpfile ) != strlen( text ) )
  {
    fclose( lpfile );
    throw std::runtime_error( mtc::strprintf( "could not write file '%s'", path ) );
  }
  fclose( lpfile );
}
