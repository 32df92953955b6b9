# include "../../dataset.hpp"
# include "../../compat.hpp"
# include <mtc/fileStream.h>
# include <mtc/exceptions.h>
# include <mtc/wcsstr.h>
# include <mtc/json.h>
# include <fcntl.h>
# include <limits>

namespace logos {

  auto  ReadFile( const char* path ) -> std::string
  {
    auto  infile = mtc::OpenFileStream( path, O_RDONLY, mtc::enable_exceptions );

    if ( infile->Size() > (std::numeric_limits<uint32_t>::max)() )
      throw mtc::FormatError<mtc::file_error>( "file '%s' is too large", path );

    if ( infile->Size() == 0 )
      return std::string();

    auto  buffer = infile->PGet( 0, uint32_t(infile->Size()) );

    return std::string( buffer->GetPtr(), buffer->GetLen() );
  }

  auto  LoadJsonFile( const char* path ) -> mtc::zmap
  {
    auto  buffer = ReadFile( path );
    auto  zvalue = mtc::zmap();

    try
    {
      mtc::json::Parse( buffer.c_str(), zvalue );
    }
    catch ( const std::exception& x )
    {
      throw DataError( mtc::strprintf( "error parsing file '%s': %s", path, x.what() ) );
    }
    return zvalue;
  }

  auto  OpenBibleData( const char* verses, const char* lexicon ) -> BibleData
  {
    if ( verses == nullptr || lexicon == nullptr )
      throw std::invalid_argument( "verses and lexicon paths expected @" __FILE__ ":" LINE_STRING );

    return LoadBibleData( LoadJsonFile( verses ), LoadJsonFile( lexicon ) );
  }

}
