# include "../../lookup.hpp"

namespace logos {

  auto  ToZmap( const MorphologyInfo& morph ) -> mtc::zmap
  {
    auto  output = mtc::zmap();
    auto  aflags = mtc::array_charstr();

    auto  setstr = [&]( const char* key, const char* str )
      {
        if ( str != nullptr )
          output.set_charstr( key, str );
      };

    setstr( "pos",      morph.GetPos() );
    setstr( "tense",    morph.GetTense() );
    setstr( "voice",    morph.GetVoice() );
    setstr( "verbForm", morph.GetVerbForm() );
    setstr( "mood",     morph.GetMood() );
    setstr( "case",     morph.GetCase() );
    setstr( "number",   morph.GetNumber() );
    setstr( "gender",   morph.GetGender() );
    setstr( "person",   morph.GetPerson() );

    for ( auto& next: morph.GetFlags() )
      aflags.push_back( next );

    output.set_array_charstr( "flags", std::move( aflags ) );
    return output;
  }

  auto  ToZmap( const TokenResponse& token ) -> mtc::zmap
  {
    auto  output = mtc::zmap{
      { "gloss",    token.gloss },
      { "greek",    token.greek },
      { "translit", token.translit },
      { "strongs",  token.strongs },
      { "rmac",     token.rmac } };

    if ( token.hasRmacDesc )
      output.set_charstr( "rmacDesc", token.rmacDesc );
    if ( token.morph.defined() )
      output.set_zmap( "morph", ToZmap( token.morph ) );
    if ( token.hasStrongDef )
      output.set_charstr( "strongDef", token.strongDef );

    return output;
  }

  auto  ToZmap( const VerseResponse& verse ) -> mtc::zmap
  {
    auto  tokens = mtc::array_zmap();

    for ( auto& next: verse.tokens )
      tokens.push_back( ToZmap( next ) );

    return mtc::zmap{
      { "reference", verse.reference },
      { "tokens",    std::move( tokens ) } };
  }

  auto  ToZmap( const VerseLookupResult& result ) -> mtc::zmap
  {
    auto  verses = mtc::array_zmap();
    auto  absent = mtc::array_charstr();

    for ( auto& next: result.verses )
      verses.push_back( ToZmap( next ) );

    for ( auto& next: result.notFound )
      absent.push_back( next );

    return mtc::zmap{
      { "verses",   std::move( verses ) },
      { "notFound", std::move( absent ) } };
  }

  auto  ToZmap( const LexiconEntry& entry ) -> mtc::zmap
  {
    return mtc::zmap{
      { "strongsNumber", entry.strongsNumber },
      { "definition",    entry.definition } };
  }

}
