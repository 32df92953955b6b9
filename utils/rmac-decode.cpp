# include "../morphology/rmac.hpp"
# include "../lookup.hpp"
# include "print-json.hpp"
# include "read-line.hpp"
# include <cstring>
# include <cstdio>
# include <vector>

int   DecodeCode( const char* code, bool compact )
{
  auto  morph = logos::MorphologyInfo();

  if ( !logos::morphology::ParseRmac( morph, code ) )
    return fprintf( stderr, "invalid RMAC code '%s'\n", code ), EINVAL;

  if ( !PrintJson( mtc::zmap{
    { "rmac",  code },
    { "morph", logos::ToZmap( morph ) } }, compact ) )
  return fprintf( stderr, "error writing output, error %d (%s)\n", errno, strerror( errno ) ), EIO;

  return 0;
}

int   DecodeInput( FILE* source, bool compact )
{
  auto  string = std::string();
  int   nerror = 0;

  while ( ReadLine( source, string ) )
  {
    if ( !string.empty() )
    {
      auto  result = DecodeCode( string.c_str(), compact );

      if ( result == EIO )
        return result;
      if ( result != 0 )
        nerror = result;
    }
  }
  return nerror;
}

const char about[] = "rmac-decode - decode Robinson's morphological analysis codes\n"
  "usage: %s [options] [code ...]\n"
  "codes are read from stdin, one per line, if not passed in command line\n"
  "options are:\n"
  "\t" "-compact - print single-line json\n";

int   main( int argc, char* argv[] )
{
  auto  compact = false;
  auto  decodes = std::vector<const char*>();
  int   nerror = 0;

  for ( int i = 1; i != argc; ++i )
  {
    if ( *argv[i] == '-' && argv[i][1] != '\0' && argv[i][1] != '-' )
    {
      if ( strcmp( argv[i], "-compact" ) == 0 )
        compact = true;
      else
      if ( strcmp( argv[i], "-h" ) == 0 || strcmp( argv[i], "-help" ) == 0 )
        return fprintf( stdout, about, argv[0] ), 0;
      else
        return fprintf( stderr, "Unknown option '%s'\n", argv[i] ), EINVAL;
    }
      else
    decodes.push_back( argv[i] );
  }

  if ( decodes.empty() )
    return DecodeInput( stdin, compact );

  for ( auto& next: decodes )
  {
    auto  result = DecodeCode( next, compact );

    if ( result == EIO )
      return result;
    if ( result != 0 )
      nerror = result;
  }
  return nerror;
}
