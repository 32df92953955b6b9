# if !defined( __logos_references_verses_hpp__ )
# define __logos_references_verses_hpp__
# include <string_view>
# include <stdexcept>
# include <string>
# include <vector>

namespace logos {
namespace references {

  class InvalidReference: public std::invalid_argument {  using std::invalid_argument::invalid_argument;  };

 /*
  * NormalizeVerseReference( ... )
  *
  * Converts free-form verse citation ('1 Corinthians 13:4', 'Matt.01.01', 'II Cor 5 17')
  * to the canonical 'Book.Chapter.Verse' form ('1Cor.13.4', 'Matt.1.1', '2Cor.5.17').
  *
  * The input is utf-8 string.  The bool version returns false for the invalid
  * references and does not modify the output; the other one throws InvalidReference.
  */
  bool  NormalizeVerseReference( std::string&, const std::string_view& );
  auto  NormalizeVerseReference( const std::string_view& ) -> std::string;

  inline
  bool  NormalizeVerseReference( std::string& out, const char* str )
    {  return str != nullptr && NormalizeVerseReference( out, std::string_view( str ) );  }
  inline
  auto  NormalizeVerseReference( const char* str ) -> std::string
    {  return NormalizeVerseReference( std::string_view( str != nullptr ? str : "" ) );  }
  inline
  auto  NormalizeVerseReference( const std::string& str ) -> std::string
    {  return NormalizeVerseReference( std::string_view( str ) );  }

  inline
  bool  IsValidVerseReference( const std::string_view& str )
    {  std::string  s;  return NormalizeVerseReference( s, str );  }

 /*
  * Canonical book codes in the canonical order
  */
  auto  ListCanonicalBooks() -> std::vector<const char*>;

 /*
  * Returns the canonical book code for book name or alias ('1corinthians', '1co', 'Matthew'),
  * or nullptr for unknown books
  */
  auto  GetCanonicalBook( const std::string_view& ) -> const char*;

}}

# endif   // !__logos_references_verses_hpp__
