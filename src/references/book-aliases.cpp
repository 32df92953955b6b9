# include "../../references/verses.hpp"
# include <unordered_map>
# include <algorithm>
# include <iterator>
# include <cctype>

namespace logos {
namespace references {

  const char* const canonicalBooks[] =
  {
    "Matt", "Mark", "Luke", "John", "Acts", "Rom", "1Cor", "2Cor", "Gal", "Eph",
    "Phil", "Col", "1Thess", "2Thess", "1Tim", "2Tim", "Titus", "Phlm", "Heb", "Jas",
    "1Pet", "2Pet", "1John", "2John", "3John", "Jude", "Rev"
  };

  struct BookAlias
  {
    const char* alias;        // lowercase
    const char* canonical;
  };

  const BookAlias bookAliases[] =
  {
    { "matthew", "Matt" },        { "matt", "Matt" },     { "mat", "Matt" },      { "mt", "Matt" },
    { "mark", "Mark" },           { "mrk", "Mark" },      { "mk", "Mark" },       { "mr", "Mark" },
    { "luke", "Luke" },           { "luk", "Luke" },      { "lk", "Luke" },
    { "john", "John" },           { "jhn", "John" },      { "jn", "John" },
    { "acts", "Acts" },           { "act", "Acts" },      { "ac", "Acts" },
    { "romans", "Rom" },          { "rom", "Rom" },       { "rm", "Rom" },        { "ro", "Rom" },
    { "1corinthians", "1Cor" },   { "1cor", "1Cor" },     { "1co", "1Cor" },
    { "2corinthians", "2Cor" },   { "2cor", "2Cor" },     { "2co", "2Cor" },
    { "galatians", "Gal" },       { "gal", "Gal" },       { "ga", "Gal" },
    { "ephesians", "Eph" },       { "eph", "Eph" },       { "ep", "Eph" },
    { "philippians", "Phil" },    { "phil", "Phil" },     { "php", "Phil" },      { "pp", "Phil" },
    { "colossians", "Col" },      { "col", "Col" },
    { "1thessalonians", "1Thess" }, { "1thess", "1Thess" }, { "1thes", "1Thess" }, { "1th", "1Thess" },
    { "2thessalonians", "2Thess" }, { "2thess", "2Thess" }, { "2thes", "2Thess" }, { "2th", "2Thess" },
    { "1timothy", "1Tim" },       { "1tim", "1Tim" },     { "1ti", "1Tim" },
    { "2timothy", "2Tim" },       { "2tim", "2Tim" },     { "2ti", "2Tim" },
    { "titus", "Titus" },         { "tit", "Titus" },     { "ti", "Titus" },
    { "philemon", "Phlm" },       { "phlm", "Phlm" },     { "phm", "Phlm" },      { "pm", "Phlm" },
    { "hebrews", "Heb" },         { "heb", "Heb" },       { "he", "Heb" },
    { "james", "Jas" },           { "jas", "Jas" },       { "jm", "Jas" },        { "jam", "Jas" },
    { "1peter", "1Pet" },         { "1pet", "1Pet" },     { "1pe", "1Pet" },      { "1pt", "1Pet" },
    { "2peter", "2Pet" },         { "2pet", "2Pet" },     { "2pe", "2Pet" },      { "2pt", "2Pet" },
    { "1john", "1John" },         { "1jhn", "1John" },    { "1jn", "1John" },
    { "2john", "2John" },         { "2jhn", "2John" },    { "2jn", "2John" },
    { "3john", "3John" },         { "3jhn", "3John" },    { "3jn", "3John" },
    { "jude", "Jude" },           { "jud", "Jude" },      { "jd", "Jude" },
    { "revelation", "Rev" },      { "revelations", "Rev" }, { "rev", "Rev" },     { "re", "Rev" },
    { "apocalypse", "Rev" }
  };

  auto  ListCanonicalBooks() -> std::vector<const char*>
  {
    return { std::begin( canonicalBooks ), std::end( canonicalBooks ) };
  }

  auto  GetCanonicalBook( const std::string_view& name ) -> const char*
  {
    static const auto aliasMap = []()
      {
        std::unordered_map<std::string, const char*>  aliases;

        for ( auto& next: bookAliases )
          aliases.emplace( next.alias, next.canonical );
        return aliases;
      }();
    auto  lowkey = std::string();
    auto  pfound = aliasMap.end();

    std::transform( name.begin(), name.end(), std::back_inserter( lowkey ), []( char c )
      {  return (char)tolower( (unsigned char)c );  } );

    return (pfound = aliasMap.find( lowkey )) != aliasMap.end() ? pfound->second : nullptr;
  }

}}
