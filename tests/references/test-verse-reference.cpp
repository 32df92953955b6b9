# include "../../references/verses.hpp"
# include <mtc/test-it-easy.hpp>

using namespace logos::references;

TestItEasy::RegisterFunc  test_verse_reference( []()
{
  TEST_CASE( "references/verses" )
  {
    SECTION( "book names and aliases are resolved case-insensitively" )
    {
      const char* refs[][2] =
      {
        { "Matt.1.1",          "Matt.1.1" },
        { "Matthew 1:1",       "Matt.1.1" },
        { "Matt 1:1",          "Matt.1.1" },
        { "matt.1.1",          "Matt.1.1" },
        { "MATT.1.1",          "Matt.1.1" },
        { "Mt 1:1",            "Matt.1.1" },
        { "MaTtHeW 1:1",       "Matt.1.1" },
        { "John 3:16",         "John.3.16" },
        { "Jn 3:16",           "John.3.16" },
        { "jhn 3:16",          "John.3.16" },
        { "Rom 8:28",          "Rom.8.28" },
        { "Romans 8:28",       "Rom.8.28" },
        { "Galatians 5:22",    "Gal.5.22" },
        { "Ephesians 2:8",     "Eph.2.8" },
        { "Philippians 4:13",  "Phil.4.13" },
        { "Colossians 3:23",   "Col.3.23" },
        { "Hebrews 11:1",      "Heb.11.1" },
        { "James 1:2",         "Jas.1.2" },
        { "Jude 1:3",          "Jude.1.3" },
        { "Revelation 22:21",  "Rev.22.21" },
        { "Revelations 22:21", "Rev.22.21" },
        { "Tit 2:11",          "Titus.2.11" },
        { "Philemon 1:6",      "Phlm.1.6" }
      };

      for ( auto& next: refs )
        REQUIRE( NormalizeVerseReference( next[0] ) == next[1] );
    }
    SECTION( "numbered books accept digit, roman and spelled prefixes" )
    {
      const char* refs[][2] =
      {
        { "1 Cor 13:4",               "1Cor.13.4" },
        { "1Cor 13:4",                "1Cor.13.4" },
        { "1 Corinthians 13:4",       "1Cor.13.4" },
        { "I Corinthians 13:4",       "1Cor.13.4" },
        { "First Corinthians 13:4",   "1Cor.13.4" },
        { "2 Cor 5:17",               "2Cor.5.17" },
        { "II Corinthians 5:17",      "2Cor.5.17" },
        { "Second Corinthians 5:17",  "2Cor.5.17" },
        { "1 Pet 2:9",                "1Pet.2.9" },
        { "2 Pet 3:9",                "2Pet.3.9" },
        { "1 John 4:8",               "1John.4.8" },
        { "2 John 1:3",               "2John.1.3" },
        { "3 John 1:4",               "3John.1.4" },
        { "III John 1:4",             "3John.1.4" },
        { "Third John 1:4",           "3John.1.4" },
        { "iii john 1:4",             "3John.1.4" },
        { "1 Thess 5:18",             "1Thess.5.18" },
        { "2 Thess 3:3",              "2Thess.3.3" },
        { "1 Tim 6:12",               "1Tim.6.12" },
        { "2 Tim 2:15",               "2Tim.2.15" }
      };

      for ( auto& next: refs )
        REQUIRE( NormalizeVerseReference( next[0] ) == next[1] );
    }
    SECTION( "separators, spaces and leading zeros are tolerated" )
    {
      const char* refs[] =
      {
        "Matt 1:1", "Matt 1.1", "Matt.1.1", "Matt.1:1", "Matt 1-1",
        "Matt.01.01", "Matt.001.001", "  Matt 1:1  ", "Matt  1:1", "Matt 1 : 1",
        "\tMatt\t1:1\n"
      };

      for ( auto& next: refs )
        REQUIRE( NormalizeVerseReference( next ) == "Matt.1.1" );

      REQUIRE( NormalizeVerseReference( "Matt 0:00" ) == "Matt.0.0" );
    }
    SECTION( "unicode spaces separate the reference parts as ascii ones do" )
    {
      const char* refs[] =
      {
        "Matt\xC2\xA0" "1:1",
        "Matt 1\xE2\x80\x89:1",
        "Matt 1:\xE2\x80\x89" "1",
        "\xC2\xA0Matt 1:1\xE2\x80\x83",
        "\xE3\x80\x80Matthew\xE3\x80\x80" "1\xC2\xA0:\xC2\xA0" "1"
      };

      for ( auto& next: refs )
        REQUIRE( NormalizeVerseReference( next ) == "Matt.1.1" );

      REQUIRE( NormalizeVerseReference( "1\xC2\xA0" "Cor\xC2\xA0" "13:4" ) == "1Cor.13.4" );
    }
    SECTION( "each of the canonical books is reachable" )
    {
      const char* refs[][2] =
      {
        { "Matt 1:1",   "Matt.1.1" },   { "Mark 1:1",   "Mark.1.1" },   { "Luke 1:1",   "Luke.1.1" },
        { "John 1:1",   "John.1.1" },   { "Acts 1:1",   "Acts.1.1" },   { "Rom 1:1",    "Rom.1.1" },
        { "1 Cor 1:1",  "1Cor.1.1" },   { "2 Cor 1:1",  "2Cor.1.1" },   { "Gal 1:1",    "Gal.1.1" },
        { "Eph 1:1",    "Eph.1.1" },    { "Phil 1:1",   "Phil.1.1" },   { "Col 1:1",    "Col.1.1" },
        { "1 Thess 1:1","1Thess.1.1" }, { "2 Thess 1:1","2Thess.1.1" }, { "1 Tim 1:1",  "1Tim.1.1" },
        { "2 Tim 1:1",  "2Tim.1.1" },   { "Titus 1:1",  "Titus.1.1" },  { "Phlm 1:1",   "Phlm.1.1" },
        { "Heb 1:1",    "Heb.1.1" },    { "Jas 1:1",    "Jas.1.1" },    { "1 Pet 1:1",  "1Pet.1.1" },
        { "2 Pet 1:1",  "2Pet.1.1" },   { "1 John 1:1", "1John.1.1" },  { "2 John 1:1", "2John.1.1" },
        { "3 John 1:1", "3John.1.1" },  { "Jude 1:1",   "Jude.1.1" },   { "Rev 1:1",    "Rev.1.1" }
      };

      for ( auto& next: refs )
        REQUIRE( NormalizeVerseReference( next[0] ) == next[1] );

      REQUIRE( ListCanonicalBooks().size() == 27 );
    }
    SECTION( "canonical references are normalized to themselves" )
    {
      const char* refs[] = { "1 Corinthians 13:4", "Matt.01.01", "III John 1:4", "Revelations 22:21" };

      for ( auto& next: refs )
      {
        auto  canonical = NormalizeVerseReference( next );

        REQUIRE( NormalizeVerseReference( canonical ) == canonical );
      }
      for ( auto& next: ListCanonicalBooks() )
      {
        auto  canonical = std::string( next ) + ".1.1";

        REQUIRE( NormalizeVerseReference( canonical ) == canonical );
      }
    }
    SECTION( "invalid references throw InvalidReference" )
    {
      const char* refs[] = { "", "   ", "Invalid", "Matt", "Matt 1", "Unknown 1:1", "Invalid 1:1", "1:1", "Hello World", "Matt 1:1a", "Gen 1:1" };

      for ( auto& next: refs )
        REQUIRE_EXCEPTION( NormalizeVerseReference( next ), InvalidReference );

      REQUIRE_EXCEPTION( NormalizeVerseReference( (const char*)nullptr ), std::invalid_argument );
    }
    SECTION( "try-style normalization does not modify output on failure" )
    {
      auto  output = std::string( "untouched" );

      REQUIRE( NormalizeVerseReference( output, "Matt 1:1" ) );
      REQUIRE( output == "Matt.1.1" );

      output = "untouched";

      REQUIRE( !NormalizeVerseReference( output, "Invalid" ) );
      REQUIRE( !NormalizeVerseReference( output, (const char*)nullptr ) );
      REQUIRE( output == "untouched" );
    }
    SECTION( "validity check is the try-style normalization" )
    {
      REQUIRE( IsValidVerseReference( "Matt 1:1" ) );
      REQUIRE( IsValidVerseReference( "John 3:16" ) );
      REQUIRE( IsValidVerseReference( "1 Cor 13:4" ) );
      REQUIRE( !IsValidVerseReference( "Invalid" ) );
      REQUIRE( !IsValidVerseReference( "Invalid 1:1" ) );
      REQUIRE( !IsValidVerseReference( "" ) );
    }
    SECTION( "book aliases resolve to canonical codes" )
    {
      REQUIRE( std::string( GetCanonicalBook( "1corinthians" ) ) == "1Cor" );
      REQUIRE( std::string( GetCanonicalBook( "APOCALYPSE" ) ) == "Rev" );
      REQUIRE( GetCanonicalBook( "genesis" ) == nullptr );
    }
  }
} );
