# include "../../lookup.hpp"
# include "../../morphology/rmac.hpp"
# include "../../references/verses.hpp"
# include "../../references/strongs.hpp"
# include <mtc/wcsstr.h>

namespace logos {

  auto  LookupToken( const BibleData& bible, const TokenData& token ) -> TokenResponse
  {
    auto  output = TokenResponse();
    auto  strong = std::string();
    auto  define = (const std::string*)nullptr;

    output.gloss       = token.gloss;
    output.greek       = token.greek;
    output.translit    = token.translit;
    output.strongs     = token.strongs;
    output.rmac        = token.rmac;
    output.rmacDesc    = token.rmacDesc;
    output.hasRmacDesc = token.hasRmacDesc;
    output.morph       = morphology::ParseRmac( token.rmac );

  // lexicon definition goes first, own token definition is the fallback
    if ( references::NormalizeStrongsNumber( strong, token.strongs ) )
      define = bible.GetDefinition( strong );

    if ( define != nullptr )
    {
      output.strongDef = *define;
      output.hasStrongDef = true;
    }
      else
    if ( token.hasStrongDef )
    {
      output.strongDef = token.strongDef;
      output.hasStrongDef = true;
    }

    return output;
  }

  auto  LookupVerses( const BibleData& bible, const std::vector<std::string>& refs ) -> VerseLookupResult
  {
    auto  normalized = std::vector<std::string>();
    auto  notNormals = std::vector<std::string>();
    auto  notPresent = std::vector<std::string>();
    auto  lookResult = VerseLookupResult();

    for ( auto& next: refs )
    {
      auto  canonical = std::string();

      if ( references::NormalizeVerseReference( canonical, next ) )
        normalized.push_back( std::move( canonical ) );
      else
        notNormals.push_back( next );
    }

    for ( auto& next: normalized )
    {
      auto  pverse = bible.GetVerse( next );

      if ( pverse != nullptr )
      {
        auto  verse = VerseResponse{ next, {} };

        for ( auto& token: pverse->tokens )
          verse.tokens.push_back( LookupToken( bible, token ) );

        lookResult.verses.push_back( std::move( verse ) );
      }
        else
      notPresent.push_back( next );
    }

    lookResult.notFound = std::move( notNormals );
      lookResult.notFound.insert( lookResult.notFound.end(), notPresent.begin(), notPresent.end() );

    return lookResult;
  }

  bool  LookupLexicon( LexiconEntry& entry, const BibleData& bible, const std::string_view& number )
  {
    auto  strong = std::string();
    auto  define = (const std::string*)nullptr;

    if ( !references::NormalizeStrongsNumber( strong, number ) )
      return false;

    if ( (define = bible.GetDefinition( strong )) == nullptr )
      return false;

    entry = { strong, *define };
    return true;
  }

  auto  LookupLexicon( const BibleData& bible, const std::string_view& number ) -> LexiconEntry
  {
    auto  strong = references::NormalizeStrongsNumber( number );
    auto  define = bible.GetDefinition( strong );

    if ( define == nullptr )
    {
      throw EntryNotFound( mtc::strprintf( "lexicon entry not found for '%s'",
        strong.c_str() ) );
    }
    return { strong, *define };
  }

}
