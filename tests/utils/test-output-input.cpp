# include "../../utils/print-json.hpp"
# include "../../utils/read-line.hpp"
# include "../toolbox/tmppath.h"
# include "../toolbox/dirtool.h"
# include <mtc/test-it-easy.hpp>
# include <fcntl.h>

TestItEasy::RegisterFunc  test_output_input( []()
{
  TEST_CASE( "utils/Serialize" )
  {
    SECTION( "write errors stop the output even with stale EINTR or EAGAIN" )
    {
      int   badfd = -1;

      errno = EINTR;
      REQUIRE( ::Serialize( &badfd, "text", 4 ) == nullptr );

      errno = EAGAIN;
      REQUIRE( ::Serialize( &badfd, "text", 4 ) == nullptr );
    }
    SECTION( "the whole buffer is written to the file" )
    {
      auto  path = GetTmpPath() + "logos-test-output.txt";
      int   handle = open( path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644 );

      if ( REQUIRE( handle >= 0 ) )
      {
        REQUIRE( ::Serialize( &handle, "V-AAI-3S\n", 9 ) == &handle );

        close( handle );

        auto  source = fopen( path.c_str(), "r" );
        auto  string = std::string();

        if ( REQUIRE( source != nullptr ) )
        {
          REQUIRE( ReadLine( source, string ) );
          REQUIRE( string == "V-AAI-3S" );
          fclose( source );
        }
      }
      RemoveFiles( GetTmpPath() + "logos-test-output.txt" );
    }
  }
  TEST_CASE( "utils/ReadLine" )
  {
    auto  path = GetTmpPath() + "logos-test-lines.txt";
    auto  longstr = std::string( 0x1000, 'N' ) + "-NSM";

    WriteTextFile( path, ("N-NSM\r\n" + longstr + "\n\nCONJ").c_str() );

    SECTION( "lines longer than the read buffer are not split" )
    {
      auto  source = fopen( path.c_str(), "r" );
      auto  string = std::string();

      if ( REQUIRE( source != nullptr ) )
      {
        REQUIRE( ReadLine( source, string ) );
        REQUIRE( string == "N-NSM" );
        REQUIRE( ReadLine( source, string ) );
        REQUIRE( string == longstr );
        REQUIRE( ReadLine( source, string ) );
        REQUIRE( string.empty() );
        REQUIRE( ReadLine( source, string ) );
        REQUIRE( string == "CONJ" );
        REQUIRE( !ReadLine( source, string ) );
        fclose( source );
      }
    }

    RemoveFiles( GetTmpPath() + "logos-test-lines.txt" );
  }
} );
