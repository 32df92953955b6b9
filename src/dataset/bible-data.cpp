# include "../../dataset.hpp"
# include <mtc/wcsstr.h>
# include <strings.h>

namespace logos {

  struct BibleData::impl
  {
    VerseMap    verses;
    LexiconMap  lexicon;
  };

  // BibleData implementation

  auto  BibleData::GetVerse( const std::string_view& ref ) const -> const VerseData*
  {
    if ( data != nullptr )
    {
      auto  pfound = data->verses.find( std::string( ref ) );

      if ( pfound != data->verses.end() )
        return &pfound->second;
    }
    return nullptr;
  }

  auto  BibleData::GetDefinition( const std::string_view& key ) const -> const std::string*
  {
    if ( data != nullptr )
    {
      auto  pfound = data->lexicon.find( std::string( key ) );

      if ( pfound != data->lexicon.end() )
        return &pfound->second;
    }
    return nullptr;
  }

  auto  BibleData::VersesCount() const -> size_t
  {
    return data != nullptr ? data->verses.size() : 0;
  }

  auto  BibleData::LexiconCount() const -> size_t
  {
    return data != nullptr ? data->lexicon.size() : 0;
  }

  // token loading

  struct TokenField
  {
    const char*               name;
    std::string TokenData::*  text;
    bool        TokenData::*  has;      // nullptr for required fields
  };

  const TokenField  tokenFields[] =
  {
    { "gloss",      &TokenData::gloss,     nullptr },
    { "greek",      &TokenData::greek,     nullptr },
    { "translit",   &TokenData::translit,  nullptr },
    { "strongs",    &TokenData::strongs,   nullptr },
    { "rmac",       &TokenData::rmac,      nullptr },
    { "rmac_desc",  &TokenData::rmacDesc,  &TokenData::hasRmacDesc },
    { "strong_def", &TokenData::strongDef, &TokenData::hasStrongDef }
  };

  auto  GetTokenField( const mtc::zmap::key& key ) -> const TokenField*
  {
    if ( key.is_charstr() )
      for ( auto& next: tokenFields )
        if ( strcasecmp( next.name, key.to_charstr() ) == 0 )
          return &next;
    return nullptr;
  }

 /*
  * Required properties have to be strings; optional ones are kept only if they
  * are strings, so null is the same as missing.  Unknown properties are skipped.
  */
  auto  LoadToken( const mtc::zmap& ztoken, const char* verse, size_t index ) -> TokenData
  {
    auto      token = TokenData();
    unsigned  found = 0;

    for ( auto& next: ztoken )
    {
      auto  pfield = GetTokenField( next.first );

      if ( pfield == nullptr )
        continue;

      if ( next.second.get_type() == mtc::zval::z_charstr )
      {
        token.*pfield->text = *next.second.get_charstr();

        if ( pfield->has != nullptr )
          token.*pfield->has = true;
        found |= 1 << (pfield - tokenFields);
      }
        else
      if ( pfield->has == nullptr )
      {
        throw DataError( mtc::strprintf( "verse '%s', token %u: property '%s' has to be string",
          verse, unsigned(index), pfield->name ) );
      }
    }

    for ( auto& next: tokenFields )
      if ( next.has == nullptr && (found & (1 << (&next - tokenFields))) == 0 )
      {
        throw DataError( mtc::strprintf( "verse '%s', token %u: property '%s' expected",
          verse, unsigned(index), next.name ) );
      }

    return token;
  }

  auto  LoadVerse( const mtc::zmap& zverse, const char* verse ) -> VerseData
  {
    auto  output = VerseData();
    auto  ptoken = zverse.get( "tokens" );

    if ( ptoken == nullptr )
      throw DataError( mtc::strprintf( "verse '%s': 'tokens' array expected", verse ) );

    switch ( ptoken->get_type() )
    {
      case mtc::zval::z_array_zmap:
        for ( auto& next: *ptoken->get_array_zmap() )
          output.tokens.push_back( LoadToken( next, verse, output.tokens.size() ) );
        break;

      case mtc::zval::z_array_zval:
        for ( auto& next: *ptoken->get_array_zval() )
        {
          if ( next.get_type() != mtc::zval::z_zmap )
          {
            throw DataError( mtc::strprintf( "verse '%s', token %u: structure expected",
              verse, unsigned(output.tokens.size()) ) );
          }
          output.tokens.push_back( LoadToken( *next.get_zmap(), verse, output.tokens.size() ) );
        }
        break;

      default:
        throw DataError( mtc::strprintf( "verse '%s': 'tokens' has to be array of structures", verse ) );
    }
    return output;
  }

  auto  LoadVerses( const mtc::zmap& zverses ) -> VerseMap
  {
    VerseMap  verses;

    for ( auto& next: zverses )
    {
      if ( !next.first.is_charstr() )
        throw DataError( "verse references have to be strings" );

      if ( next.second.get_type() != mtc::zval::z_zmap )
      {
        throw DataError( mtc::strprintf( "verse '%s' has to be structure",
          next.first.to_charstr() ) );
      }

      verses.emplace( next.first.to_charstr(),
        LoadVerse( *next.second.get_zmap(), next.first.to_charstr() ) );
    }
    return verses;
  }

  auto  LoadLexicon( const mtc::zmap& zlexicon ) -> LexiconMap
  {
    LexiconMap  lexicon;

    for ( auto& next: zlexicon )
    {
      if ( !next.first.is_charstr() )
        throw DataError( "lexicon keys have to be strings" );

      if ( next.second.get_type() != mtc::zval::z_charstr )
      {
        throw DataError( mtc::strprintf( "lexicon entry '%s' has to be string",
          next.first.to_charstr() ) );
      }

      lexicon.emplace( next.first.to_charstr(), *next.second.get_charstr() );
    }
    return lexicon;
  }

  auto  LoadBibleData( VerseMap&& verses, LexiconMap&& lexicon ) -> BibleData
  {
    BibleData bibleData;
    auto      loadData = std::make_shared<BibleData::impl>();

    loadData->verses = std::move( verses );
    loadData->lexicon = std::move( lexicon );

    return bibleData.data = loadData, bibleData;
  }

  auto  LoadBibleData( const mtc::zmap& verses, const mtc::zmap& lexicon ) -> BibleData
  {
    return LoadBibleData( LoadVerses( verses ), LoadLexicon( lexicon ) );
  }

}
