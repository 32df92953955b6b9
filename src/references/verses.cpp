# include "../../references/verses.hpp"
# include "../text-scan.hpp"
# include <cstring>

namespace logos {
namespace references {

 /*
  * Verse reference layout:
  *
  *   ^\s*(?:(\d|I{1,3}|First|Second|Third)\s*)?([A-Za-z]+)[\s.]*(\d+)[\s:.\-]+(\d+)\s*$
  *
  * Prefix variants are checked in the order listed, the first variant followed
  * by the valid book-chapter-verse tail wins; the book is resolved after that.
  */
  struct Reference
  {
    std::string prefix;
    std::string book;
    std::string chapter;
    std::string verse;
  };

  struct Ordinal
  {
    const char* word;
    const char* code;
  };

  const Ordinal ordinals[] =
  {
    { "first",  "1" },
    { "second", "2" },
    { "third",  "3" }
  };

  // ([A-Za-z]+)[\s.]*(\d+)[\s:.\-]+(\d+)\s*$
  bool  MatchTail( Reference& refer, const widechar* ptrtop, const widechar* ptrend )
  {
    const widechar* ptrorg;

  // book name
    for ( refer.book.clear(); ptrtop != ptrend && IsLatin( *ptrtop ); ++ptrtop )
      refer.book += ToLower( *ptrtop );

    if ( refer.book.empty() )
      return false;

  // chapter
    while ( ptrtop != ptrend && (IsSpace( *ptrtop ) || *ptrtop == '.') )
      ++ptrtop;

    if ( (ptrtop = GetNumber( refer.chapter, ptrtop, ptrend )) == ptrend || refer.chapter.empty() )
      return false;

  // separator and verse
    for ( ptrorg = ptrtop; ptrtop != ptrend && (IsSpace( *ptrtop ) || *ptrtop == ':' || *ptrtop == '.' || *ptrtop == '-'); )
      ++ptrtop;

    if ( ptrtop == ptrorg )
      return false;

    ptrtop = GetNumber( refer.verse, ptrtop, ptrend );

    return !refer.verse.empty() && SkipSpace( ptrtop, ptrend ) == ptrend;
  }

  bool  MatchReference( Reference& refer, const widechar* ptrtop, const widechar* ptrend )
  {
    size_t  nroman;

    ptrtop = SkipSpace( ptrtop, ptrend );

  // digit prefix
    if ( ptrtop != ptrend && IsDigit( *ptrtop ) && MatchTail( refer, SkipSpace( ptrtop + 1, ptrend ), ptrend ) )
      return refer.prefix = std::string( 1, (char)*ptrtop ), true;

  // roman prefix, greedy
    for ( nroman = 0; nroman != 3 && ptrtop + nroman != ptrend && ToUpper( ptrtop[nroman] ) == 'I'; )
      ++nroman;

    for ( ; nroman != 0; --nroman )
      if ( MatchTail( refer, SkipSpace( ptrtop + nroman, ptrend ), ptrend ) )
        return refer.prefix = std::to_string( nroman ), true;

  // spelled prefix
    for ( auto& next: ordinals )
    {
      auto  cchword = strlen( next.word );

      if ( size_t(ptrend - ptrtop) >= cchword && mtc::w_strncasecmp( ptrtop, next.word, cchword ) == 0
        && MatchTail( refer, SkipSpace( ptrtop + cchword, ptrend ), ptrend ) )
      return refer.prefix = next.code, true;
    }

  // no prefix
    return refer.prefix.clear(), MatchTail( refer, ptrtop, ptrend );
  }

  bool  NormalizeVerseReference( std::string& output, const std::string_view& input )
  {
    auto  wsinput = codepages::mbcstowide( codepages::codepage_utf8, input.data(), input.size() );
    auto  reference = Reference();
    auto  canonical = (const char*)nullptr;

    if ( !MatchReference( reference, wsinput.c_str(), wsinput.c_str() + wsinput.size() ) )
      return false;

    if ( (canonical = GetCanonicalBook( reference.prefix + reference.book )) == nullptr )
      return false;

    output = std::string( canonical ) + '.' + reference.chapter + '.' + reference.verse;
    return true;
  }

  auto  NormalizeVerseReference( const std::string_view& input ) -> std::string
  {
    auto  output = std::string();

    if ( !NormalizeVerseReference( output, input ) )
    {
      throw InvalidReference( mtc::strprintf( "invalid verse reference: '%s'",
        std::string( input ).c_str() ) );
    }
    return output;
  }

}}
