#ifndef LIBJSONSELECT_EXCEPTIONS_H
#define LIBJSONSELECT_EXCEPTIONS_H
#include "libjsonselect/tokens.hpp"
#include <exception>   // std::exception
#include <sstream>     // std::ostringstream
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libjsonselect {

inline std::string format_exception(
    std::string_view message, const Token& token) {
  std::ostringstream rv{};
  rv << message << " ('" << token.query << "':" << token.index << ")";
  return rv.str();
}

// Base class for all exceptions thrown from libjsonselect.
class Exception : public std::exception {
public:
  Exception(std::string_view message, const Token& token)
      : m_message{format_exception(message, token)}, m_token{token} {};

  const char* what() const noexcept override { return m_message.c_str(); };
  const Token& token() const noexcept { return m_token; };

  // The byte offset into the query at which the error was detected.
  std::string::size_type offset() const noexcept { return m_token.index; };

private:
  std::string m_message{};
  Token m_token{};
};

// An exception thrown due to an error during path tokenization.
//
// A LexerError indicates a bug in the Lexer class. During normal operation,
// invalid syntax found when scanning a path will leave an error token in the
// resulting _tokens_ collection.
class LexerError : public Exception {
public:
  LexerError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};

// An exception thrown due to invalid path syntax, including malformed string
// escapes and integer literals. Parsing is all or nothing, a SyntaxError is
// never accompanied by a partial result.
class SyntaxError : public Exception {
public:
  SyntaxError(std::string_view message, const Token& token)
      : Exception{message, token} {};
};
} // namespace libjsonselect

#endif // LIBJSONSELECT_EXCEPTIONS_H
