#include "libjsonselect/lex.hpp"
#include "libjsonselect/exceptions.hpp" // libjsonselect::LexerError
#include "libjsonselect/utils.hpp"      // libjsonselect::utf8_sequence_length
#include <string> // std::string

namespace libjsonselect {

using namespace std::string_literals;

namespace {
std::string quoted(char c) { return "'"s + c + "'"s; }
} // namespace

Lexer::Lexer(std::string_view query)
    : query{query}, m_length{query.length()} {};

Lexer::State Lexer::lex_root() {
  ignore_whitespace();

  const auto c{next()};
  if (!c) {
    error("expected '$', found end of query");
    return ERROR;
  }

  if (c.value() != '$') {
    backup();
    error("expected '$', found "s + quoted(c.value()));
    return ERROR;
  }

  emit(TokenType::root);
  return LEX_SEGMENT;
};

Lexer::State Lexer::lex_segment() {
  ignore_whitespace();

  const auto maybe_c(next());
  if (!maybe_c) {
    emit(TokenType::eof_);
    return NONE;
  }

  const auto c{maybe_c.value()};
  switch (c) {
  case '.':
    if (peek().value_or('\0') == '.') {
      next();
      emit(TokenType::ddot);
      return LEX_DESCENDANT_SELECTION;
    }
    return LEX_DOT_SELECTOR;
  case '[':
    if (view().starts_with("*]")) {
      m_pos += 2;
      emit(TokenType::wild_index);
      return LEX_SEGMENT;
    }
    emit(TokenType::lbracket);
    return LEX_INSIDE_BRACKETED_SELECTION;
  default:
    backup();
    error("expected '.', '..' or a bracketed selection, found "s + quoted(c));
    return ERROR;
  }
}

Lexer::State Lexer::lex_descendant_selection() {
  const auto maybe_c(next());
  if (!maybe_c) {
    error("bald descendant segment");
    return ERROR;
  }

  const auto c{maybe_c.value()};
  switch (c) {
  case ' ':
    backup();
    error("unexpected whitespace after descendant segment");
    return ERROR;
  case '*':
    emit(TokenType::wild);
    return LEX_SEGMENT;
  case '[':
    if (view().starts_with("*]")) {
      m_pos += 2;
      emit(TokenType::wild_index);
      return LEX_SEGMENT;
    }
    emit(TokenType::lbracket);
    return LEX_INSIDE_BRACKETED_SELECTION;
  default:
    backup();
    if (accept_name()) {
      emit(TokenType::name_);
      return LEX_SEGMENT;
    }
    error("unexpected descendant selection token "s + quoted(c));
    return ERROR;
  }
}

Lexer::State Lexer::lex_dot_selector() {
  ignore(); // Ignore the dot.

  const auto c{next()};
  if (!c) {
    error("unexpected end of query after dot");
    return ERROR;
  }

  if (c.value() == ' ') {
    backup();
    error("unexpected whitespace after dot");
    return ERROR;
  }

  if (c.value() == '*') {
    emit(TokenType::wild);
    return LEX_SEGMENT;
  }

  backup();
  if (accept_name()) {
    emit(TokenType::name_);
    return LEX_SEGMENT;
  }

  error("unexpected shorthand selector "s + quoted(c.value()));
  return ERROR;
}

Lexer::State Lexer::lex_inside_bracketed_selection() {
  std::optional<char> c;
  while (true) {
    ignore_whitespace();
    c = next();

    if (!c) {
      error("unclosed bracketed selection");
      return ERROR;
    }

    switch (c.value()) {
    case ']':
      emit(TokenType::rbracket);
      return LEX_SEGMENT;
    case ',':
      emit(TokenType::comma);
      continue;
    case ':':
      emit(TokenType::colon);
      continue;
    case '\'':
      return LEX_INSIDE_SINGLE_QUOTED_STRING;
    case '"':
      return LEX_INSIDE_DOUBLE_QUOTED_STRING;
    case '-':
      if (!(accept_run(s_digits))) {
        error("expected at least one digit after a minus sign");
        return ERROR;
      }
      // A negative index.
      emit(TokenType::index);
      continue;
    default:
      backup();

      if (accept_run(s_digits)) {
        emit(TokenType::index);
        continue;
      }

      error("unexpected token in bracketed selection "s + quoted(c.value()));
      return ERROR;
    }
  }
}

void Lexer::run() {
  auto current_state{LEX_ROOT};

  while (true) {
    switch (current_state) {
    case ERROR:
    case NONE:
      return;
    case LEX_ROOT:
      current_state = lex_root();
      break;
    case LEX_SEGMENT:
      current_state = lex_segment();
      break;
    case LEX_DESCENDANT_SELECTION:
      current_state = lex_descendant_selection();
      break;
    case LEX_DOT_SELECTOR:
      current_state = lex_dot_selector();
      break;
    case LEX_INSIDE_BRACKETED_SELECTION:
      current_state = lex_inside_bracketed_selection();
      break;
    case LEX_INSIDE_SINGLE_QUOTED_STRING:
      current_state = lex_inside_string<'\'', TokenType::sq_string>();
      break;
    case LEX_INSIDE_DOUBLE_QUOTED_STRING:
      current_state = lex_inside_string<'"', TokenType::dq_string>();
      break;
    default:
      throw LexerError("unknown lexer state",
          Token{TokenType::error, {}, m_pos, query});
    }
  }
};

void Lexer::emit(TokenType t) {
  std::string_view view{query};
  view.remove_prefix(m_start);
  view.remove_suffix(m_length - m_pos);
  m_tokens.push_back(Token{t, view, m_start, query});
  m_start = m_pos;
};

std::optional<char> Lexer::next() {
  if (m_pos >= m_length) {
    return std::nullopt;
  }

  return std::optional<char>(std::in_place, query[m_pos++]);
};

std::string_view Lexer::view() const {
  std::string_view view_{query};
  view_.remove_prefix(m_pos);
  return view_;
}

void Lexer::ignore() { m_start = m_pos; }

void Lexer::backup() {
  if (m_pos > m_start) {
    --m_pos;
  }
}

std::optional<char> Lexer::peek() {
  const auto c = next();
  if (c) {
    backup();
  }

  return c;
}

bool Lexer::accept_run(const std::unordered_set<char>& valid) {
  auto found{false};
  auto c = next();
  while (c && valid.contains(c.value())) {
    c = next();
    found = true;
  }

  if (c) {
    backup();
  }

  return found;
}

bool Lexer::accept_name() {
  const auto start{m_pos};

  while (m_pos < m_length) {
    if (static_cast<unsigned char>(query[m_pos]) < 0x80) {
      if (!is_name_char(query[m_pos])) {
        break;
      }
      m_pos++;
      continue;
    }

    // Any code point from U+0080, one whole sequence at a time.
    const auto length{utf8_sequence_length(query, m_pos)};
    if (!length) {
      break;
    }
    m_pos += length;
  }

  return m_pos > start;
}

bool Lexer::ignore_whitespace() {
  if (accept_run(Lexer::s_whitespace)) {
    ignore();
    return true;
  }
  return false;
}

void Lexer::error(std::string_view message) { error(message, m_pos); }

void Lexer::error(std::string_view message, std::string::size_type index) {
  m_error = message;
  m_tokens.push_back(Token{TokenType::error, m_error, index, query});
}

bool Lexer::is_name_char(char c) noexcept {
  const auto byte{static_cast<unsigned char>(c)};
  return (byte >= 'a' && byte <= 'z') ||
         (byte >= 'A' && byte <= 'Z') || (byte >= '0' && byte <= '9') ||
         byte == '_' || byte == '-';
}

} // namespace libjsonselect
