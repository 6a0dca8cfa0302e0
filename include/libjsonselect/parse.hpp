#ifndef LIBJSONSELECT_PARSE_H
#define LIBJSONSELECT_PARSE_H

#include "libjsonselect/lex.hpp" // libjsonselect::Tokens
#include "libjsonselect/selectors.hpp"
#include "libjsonselect/tokens.hpp"
#include <cstdint>     // std::int32_t std::int64_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libjsonselect {

using TokenIterator = Tokens::const_iterator;

// The path parser.
//
// An instance of _libjsonselect::Parser_ does not maintain any state, so
// repeated calls to _Parser.parse()_ are OK and, in fact, encouraged.
class Parser {
public:
  // Parse tokens from _tokens_ and return a sequence of selectors making up
  // the path. _tokens_ must end with an _eof_ or _error_ token, as produced by
  // _Lexer.run()_.
  selectors_t parse(const Tokens& tokens) const;
  selectors_t parse(std::string_view s) const;

protected:
  selector_t parse_matcher(TokenIterator& tokens) const;
  DescendantSelector parse_descendant(TokenIterator& tokens) const;
  UnionSelector parse_union(TokenIterator& tokens) const;
  SliceElement parse_slice_element(TokenIterator& tokens) const;

  // Assert that the current token in _it_ has a type matching _tt_.
  void expect(TokenIterator it, TokenType tt) const;

  // Assert that the next token in _it_ has a type matching _tt_.
  void expect_peek(TokenIterator it, TokenType tt) const;

  // Decode escape sequences in a quoted string token.
  std::string decode_string_token(const Token& t) const;

private:
  // Convert a Token's value to an int. It is assumed that the view is
  // composed of digits with the possibility of a leading minus sign, as
  // one would get from a _Token_ of type _index_.
  std::int64_t token_to_int(const Token& t) const;

  // Return a copy of _sv_ with all escape sequences replaced with the
  // characters they represent. `\'` is only valid in single quoted strings.
  std::string unescape_json_string(
      std::string_view sv, const Token& token) const;

  // Return the value of the four hex digits at _index_ in _sv_.
  std::int32_t decode_hex_char(std::string_view sv,
      std::string::size_type index, const Token& token) const;

  // Return the unicode code point _code_point_ encoded in UTF-8.
  std::string encode_utf8(std::int32_t code_point, const Token& token) const;
};

} // namespace libjsonselect

#endif // LIBJSONSELECT_PARSE_H
