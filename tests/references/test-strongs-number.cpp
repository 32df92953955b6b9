# include "../../references/strongs.hpp"
# include <mtc/test-it-easy.hpp>

using namespace logos::references;

TestItEasy::RegisterFunc  test_strongs_number( []()
{
  TEST_CASE( "references/strongs" )
  {
    SECTION( "prefix is uppercased, spaces and leading zeros are removed" )
    {
      const char* numbers[][2] =
      {
        { "G25",       "G25" },
        { "g25",       "G25" },
        { "G 25",      "G25" },
        { "G0025",     "G25" },
        { "g 0025",    "G25" },
        { "G976",      "G976" },
        { "G5547",     "G5547" },
        { "H1234",     "H1234" },
        { "h1234",     "H1234" },
        { "H 1234",    "H1234" },
        { "H0001",     "H1" },
        { "h 0001",    "H1" },
        { "H430",      "H430" },
        { "  G25  ",   "G25" },
        { "G  25",     "G25" },
        { "  H1234  ", "H1234" }
      };

      for ( auto& next: numbers )
        REQUIRE( NormalizeStrongsNumber( next[0] ) == next[1] );
    }
    SECTION( "unicode spaces are removed as ascii ones are" )
    {
      REQUIRE( NormalizeStrongsNumber( "\xC2\xA0G25\xE2\x80\x89" ) == "G25" );
      REQUIRE( NormalizeStrongsNumber( "G\xC2\xA0" "25" ) == "G25" );
      REQUIRE( NormalizeStrongsNumber( "h\xE2\x80\x89" "0001\xE3\x80\x80" ) == "H1" );
      REQUIRE( !IsValidStrongsNumber( "G2\xC2\xA0" "5" ) );
    }
    SECTION( "all-zero numbers keep a single zero" )
    {
      REQUIRE( NormalizeStrongsNumber( "G0" ) == "G0" );
      REQUIRE( NormalizeStrongsNumber( "H0" ) == "H0" );
      REQUIRE( NormalizeStrongsNumber( "G00" ) == "G0" );
      REQUIRE( NormalizeStrongsNumber( "G000" ) == "G0" );
      REQUIRE( NormalizeStrongsNumber( "G1" ) == "G1" );
      REQUIRE( NormalizeStrongsNumber( "G01" ) == "G1" );
      REQUIRE( NormalizeStrongsNumber( "G001" ) == "G1" );
      REQUIRE( NormalizeStrongsNumber( "G0001" ) == "G1" );
      REQUIRE( NormalizeStrongsNumber( "G0025" ) == NormalizeStrongsNumber( "G25" ) );
    }
    SECTION( "normalized numbers are normalized to themselves" )
    {
      const char* numbers[] = { "g 0025", "H0001", "G000", "  h1234 " };

      for ( auto& next: numbers )
      {
        auto  normal = NormalizeStrongsNumber( next );

        REQUIRE( NormalizeStrongsNumber( normal ) == normal );
      }
    }
    SECTION( "invalid numbers throw InvalidStrongsNumber" )
    {
      const char* numbers[] =
      {
        "", "   ", "invalid", "X25", "A1234", "G", "H", "25", "1234",
        "GH25", "G25H", "Hello", "G-25", "G.25"
      };

      for ( auto& next: numbers )
        REQUIRE_EXCEPTION( NormalizeStrongsNumber( next ), InvalidStrongsNumber );

      REQUIRE_EXCEPTION( NormalizeStrongsNumber( (const char*)nullptr ), std::invalid_argument );
    }
    SECTION( "try-style normalization does not modify output on failure" )
    {
      auto  output = std::string();

      REQUIRE( NormalizeStrongsNumber( output, "G25" ) );
      REQUIRE( output == "G25" );
      REQUIRE( NormalizeStrongsNumber( output, "H1234" ) );
      REQUIRE( output == "H1234" );

      REQUIRE( !NormalizeStrongsNumber( output, "X25" ) );
      REQUIRE( !NormalizeStrongsNumber( output, (const char*)nullptr ) );
      REQUIRE( output == "H1234" );
    }
    SECTION( "validity check is the try-style normalization" )
    {
      REQUIRE( IsValidStrongsNumber( "G25" ) );
      REQUIRE( IsValidStrongsNumber( "h 0001" ) );
      REQUIRE( !IsValidStrongsNumber( "G" ) );
      REQUIRE( !IsValidStrongsNumber( "" ) );
    }
  }
} );
