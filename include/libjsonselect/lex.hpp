#ifndef LIBJSONSELECT_LEX_H
#define LIBJSONSELECT_LEX_H

#include "libjsonselect/tokens.hpp"
#include <deque>         // std::deque
#include <optional>      // std::optional
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_set> // std::unordered_set

namespace libjsonselect {

using Tokens = std::deque<Token>;

// A path tokenizer implemented as a state machine. Each state is a method
// returning the next state.
//
// Call _run()_ once, then read tokens from _tokens()_. The last token is
// always of type _eof_ or _error_. An error token's value is the error
// message and its index is the offset of the first character that could not
// be matched. Token and message views are valid for the lifetime of the
// query string and the lexer.
class Lexer {
public:
  explicit Lexer(std::string_view query);

  // The query string being tokenized.
  const std::string_view query;

  void run();
  const Tokens& tokens() const noexcept { return m_tokens; };

private:
  enum State {
    ERROR,
    NONE,
    LEX_ROOT,
    LEX_SEGMENT,
    LEX_DESCENDANT_SELECTION,
    LEX_DOT_SELECTOR,
    LEX_INSIDE_BRACKETED_SELECTION,
    LEX_INSIDE_SINGLE_QUOTED_STRING,
    LEX_INSIDE_DOUBLE_QUOTED_STRING,
  };

  static inline const std::unordered_set<char> s_digits{
      '0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

  // A single ASCII space is the only insignificant whitespace character.
  static inline const std::unordered_set<char> s_whitespace{' '};

  std::string::size_type m_length{};
  std::string::size_type m_start{0};
  std::string::size_type m_pos{0};
  std::string m_error{};
  Tokens m_tokens{};

  State lex_root();
  State lex_segment();
  State lex_descendant_selection();
  State lex_dot_selector();
  State lex_inside_bracketed_selection();

  // Scan a quoted string. The opening quote has already been consumed. The
  // emitted token's value excludes both quotes. Escape sequences are left
  // for the parser to decode.
  template <char quote, TokenType token_type> State lex_inside_string() {
    ignore(); // Ignore the opening quote.

    while (true) {
      const auto c{next()};

      if (!c || (c.value() == '\\' && !next())) {
        error(std::string{"unclosed string literal starting at index "} +
                  std::to_string(m_start - 1),
            m_start - 1);
        return ERROR;
      }

      if (c.value() == quote) {
        backup();
        emit(token_type);
        next();
        ignore(); // Ignore the closing quote.
        return LEX_INSIDE_BRACKETED_SELECTION;
      }
    }
  }

  // Append a token of type _t_ spanning m_start to m_pos.
  void emit(TokenType t);

  // Return the next character and advance the position, or nullopt at the
  // end of the query.
  std::optional<char> next();

  // Return a view of the query from the current position.
  std::string_view view() const;

  // Discard characters between m_start and m_pos.
  void ignore();

  // Step back one character, never beyond the start of the current token.
  void backup();

  std::optional<char> peek();

  bool accept_run(const std::unordered_set<char>& valid);

  // Consume one or more unquoted name characters. Non-ASCII characters must
  // be well-formed UTF-8.
  bool accept_name();

  bool ignore_whitespace();

  // Append an error token with _message_ at the current position, or at
  // _index_.
  void error(std::string_view message);
  void error(std::string_view message, std::string::size_type index);

  // True if _c_ is an ASCII name character.
  static bool is_name_char(char c) noexcept;
};

} // namespace libjsonselect

#endif // LIBJSONSELECT_LEX_H
