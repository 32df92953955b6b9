# include "../references/strongs.hpp"
# include "../lookup.hpp"
# include "print-json.hpp"
# include <mtc/exceptions.h>
# include <cstring>
# include <cstdio>

int   PrintEntry( const char* path, const char* number, bool compact )
{
  auto  bible = logos::LoadBibleData( mtc::zmap(), logos::LoadJsonFile( path ) );
  auto  entry = logos::LexiconEntry();

  try
  {
    entry = logos::LookupLexicon( bible, number );
  }
  catch ( const logos::references::InvalidStrongsNumber& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), EINVAL;
  }
  catch ( const logos::EntryNotFound& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), ENOENT;
  }

  if ( !PrintJson( logos::ToZmap( entry ), compact ) )
    return fprintf( stderr, "error writing output, error %d (%s)\n", errno, strerror( errno ) ), EIO;

  return 0;
}

const char about[] = "lexicon-lookup - get the lexicon definition for Strong's number\n"
  "usage: %s [options] lexicon.json strongs-number\n"
  "options are:\n"
  "\t" "-compact - print single-line json\n";

int   main( int argc, char* argv[] )
{
  auto  lexicon = (const char*)nullptr;
  auto  strongs = (const char*)nullptr;
  auto  compact = false;

  for ( int i = 1; i != argc; ++i )
  {
    if ( *argv[i] == '-' )
    {
      if ( strcmp( argv[i], "-compact" ) == 0 )
        compact = true;
      else
        return fprintf( stderr, "Unknown option '%s'\n", argv[i] ), EINVAL;
    }
      else
    if ( lexicon == nullptr ) lexicon = argv[i];
      else
    if ( strongs == nullptr ) strongs = argv[i];
      else
    return fprintf( stderr, "invalid parameter count, unexpected '%s'\n", argv[i] ), EINVAL;
  }

  if ( lexicon == nullptr || strongs == nullptr )
    return fprintf( stdout, about, argv[0] ), 0;

  try
  {
    return PrintEntry( lexicon, strongs, compact );
  }
  catch ( const mtc::file_error& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), ENOENT;
  }
  catch ( const logos::DataError& x )
  {
    return fprintf( stderr, "%s\n", x.what() ), EINVAL;
  }
}
