# include "../../references/strongs.hpp"
# include "../text-scan.hpp"

namespace logos {
namespace references {

  // ^\s*([GgHh])\s*0*(\d+)\s*$
  bool  NormalizeStrongsNumber( std::string& output, const std::string_view& input )
  {
    auto  wsinput = codepages::mbcstowide( codepages::codepage_utf8, input.data(), input.size() );
    auto  ptrtop = wsinput.c_str();
    auto  ptrend = wsinput.c_str() + wsinput.size();
    auto  prefix = char();
    auto  digits = std::string();

    if ( (ptrtop = SkipSpace( ptrtop, ptrend )) == ptrend )
      return false;

    if ( (prefix = ToUpper( *ptrtop )) != 'G' && prefix != 'H' )
      return false;

    ptrtop = SkipSpace( ptrtop + 1, ptrend );

    if ( ptrtop == ptrend || !IsDigit( *ptrtop ) )
      return false;

    if ( (ptrtop = SkipSpace( GetNumber( digits, ptrtop, ptrend ), ptrend )) != ptrend )
      return false;

    output = prefix + digits;
    return true;
  }

  auto  NormalizeStrongsNumber( const std::string_view& input ) -> std::string
  {
    auto  output = std::string();

    if ( !NormalizeStrongsNumber( output, input ) )
    {
      throw InvalidStrongsNumber( mtc::strprintf( "invalid Strong's number: '%s'",
        std::string( input ).c_str() ) );
    }
    return output;
  }

}}
