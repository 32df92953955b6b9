# include "../references/verses.hpp"
# include "../lookup.hpp"
# include "print-json.hpp"
# include <mtc/exceptions.h>
# include <cstring>
# include <cstdio>

bool  verbose = false;

auto  LoadBible( const char* verses, const char* lexicon ) -> logos::BibleData
{
  auto  bible = logos::OpenBibleData( verses, lexicon );

  if ( verbose )
  {
    fprintf( stderr, "Loaded %u verses from '%s'\n", unsigned(bible.VersesCount()), verses );
    fprintf( stderr, "Loaded %u lexicon entries from '%s'\n", unsigned(bible.LexiconCount()), lexicon );
  }
  return bible;
}

auto  LookupAndLog( const logos::BibleData& bible, const std::vector<std::string>& refs ) -> logos::VerseLookupResult
{
  if ( verbose )
    fprintf( stderr, "Starting verse lookup for %u references\n", unsigned(refs.size()) );

  auto  result = logos::LookupVerses( bible, refs );

  if ( verbose )
  {
    for ( auto& next: result.notFound )
    {
      if ( logos::references::IsValidVerseReference( next ) )
        fprintf( stderr, "Verse not found in dictionary: %s\n", next.c_str() );
      else
        fprintf( stderr, "Failed to normalize verse reference: %s\n", next.c_str() );
    }
    fprintf( stderr, "Verse lookup complete. Found: %u, NotFound: %u\n",
      unsigned(result.verses.size()), unsigned(result.notFound.size()) );
  }
  return result;
}

const char about[] = "verse-lookup - get the verses with morphology and lexicon definitions\n"
  "usage: %s [options] verses.json lexicon.json reference [reference ...]\n"
  "options are:\n"
  "\t" "-v - log the lookup to stderr;\n"
  "\t" "-compact - print single-line json\n";

int   main( int argc, char* argv[] )
{
  auto  verses = (const char*)nullptr;
  auto  lexicon = (const char*)nullptr;
  auto  compact = false;
  auto  refs = std::vector<std::string>();

  for ( int i = 1; i != argc; ++i )
  {
    if ( *argv[i] == '-' )
    {
      if ( strcmp( argv[i], "-v" ) == 0 )
        verbose = true;
      else
      if ( strcmp( argv[i], "-compact" ) == 0 )
        compact = true;
      else
        return fprintf( stderr, "Unknown option '%s'\n", argv[i] ), EINVAL;
    }
      else
    if ( verses == nullptr )  verses = argv[i];
      else
    if ( lexicon == nullptr ) lexicon = argv[i];
      else
    refs.push_back( argv[i] );
  }

  if ( verses == nullptr || lexicon == nullptr || refs.empty() )
    return fprintf( stdout, about, argv[0] ), 0;

  try
  {
    auto  bible = LoadBible( verses, lexicon );

    if ( !PrintJson( logos::ToZmap( LookupAndLog( bible, refs ) ), compact ) )
      return fprintf( stderr, "error writing output, error %d (%s)\n", errno, strerror( errno ) ), EIO;

    return 0;
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
