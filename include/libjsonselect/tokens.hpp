#ifndef LIBJSONSELECT_TOKENS_H
#define LIBJSONSELECT_TOKENS_H

#include <iostream>
#include <string>
#include <string_view>

namespace libjsonselect {
enum class TokenType {
  eof_,       // EOF
  colon,      // :
  comma,      // ,
  ddot,       // ..
  dq_string,  // DQ_STRING
  error,      // ERROR
  index,      // INDEX
  lbracket,   // [
  name_,      // NAME
  rbracket,   // ]
  root,       // $
  sq_string,  // SQ_STRING
  wild,       // *
  wild_index, // [*]
};

// Return a string representation of TokenType _tt_.
std::string token_type_to_string(TokenType tt);

std::ostream& operator<<(std::ostream& os, TokenType const& tt);

// A token's _value_ and _query_ are views of the query string passed to the
// lexer. _index_ is the byte offset of the token from the start of the query.
struct Token {
  TokenType type{};
  std::string_view value{};
  std::string::size_type index{};
  std::string_view query{};
};

// Return a string representation of Token _t_.
std::string token_to_string(const Token& token);

bool operator==(const Token& lhs, const Token& rhs);
std::ostream& operator<<(std::ostream& os, Token const& token);
} // namespace libjsonselect

#endif
