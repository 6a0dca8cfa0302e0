#include "libjsonselect/parse.hpp"
#include "libjsonselect/exceptions.hpp" // libjsonselect::SyntaxError
#include "libjsonselect/lex.hpp"        // libjsonselect::Lexer
#include "libjsonselect/utils.hpp"      // libjsonselect::utf8_sequence_length
#include <charconv>                     // std::from_chars
#include <iterator>                     // std::next
#include <string>                       // std::string
#include <system_error>                 // std::errc

namespace libjsonselect {

using namespace std::string_literals;

namespace {
// Return a copy of _token_ pointing _offset_ bytes past its start.
Token token_at(const Token& token, std::string::size_type offset) {
  return Token{token.type, token.value, token.index + offset, token.query};
}
} // namespace

selectors_t Parser::parse(const Tokens& tokens) const {
  if (tokens.empty()) {
    throw SyntaxError("expected '$', found end of query", Token{});
  }

  const auto& last{tokens.back()};
  if (last.type == TokenType::error) {
    // The error token's value is a view of the lexer's error message, which
    // might not outlive the exception.
    throw SyntaxError(
        last.value, Token{TokenType::error, {}, last.index, last.query});
  }

  if (last.type != TokenType::eof_) {
    throw SyntaxError("expected end of query, found '"s +
                          std::string(last.value) + "'"s,
        last);
  }

  TokenIterator it = tokens.cbegin();
  expect(it, TokenType::root);

  selectors_t selectors{RootSelector{*it}};
  it++;

  while (it->type != TokenType::eof_) {
    selectors.push_back(parse_matcher(it));
    it++;
  }

  return selectors;
}

selectors_t Parser::parse(std::string_view s) const {
  Lexer lexer{s};
  lexer.run();
  return parse(lexer.tokens());
}

selector_t Parser::parse_matcher(TokenIterator& tokens) const {
  switch (tokens->type) {
  case TokenType::name_:
    return ChildNameSelector{*tokens, std::string{tokens->value}};
  case TokenType::wild:
    return WildChildSelector{*tokens};
  case TokenType::wild_index:
    return WildIndexSelector{*tokens};
  case TokenType::lbracket:
    return parse_union(tokens);
  case TokenType::ddot:
    return parse_descendant(tokens);
  default:
    throw SyntaxError("unexpected token "s +
                          token_type_to_string(tokens->type) + " '"s +
                          std::string(tokens->value) + "'"s,
        *tokens);
  }
}

DescendantSelector Parser::parse_descendant(TokenIterator& tokens) const {
  const auto token{*tokens};
  tokens++; // move past the double dot

  switch (tokens->type) {
  case TokenType::name_:
    return DescendantSelector{
        token, ChildNameSelector{*tokens, std::string{tokens->value}}};
  case TokenType::wild:
    return DescendantSelector{token, WildChildSelector{*tokens}};
  case TokenType::wild_index:
    return DescendantSelector{token, WildIndexSelector{*tokens}};
  case TokenType::lbracket:
    return DescendantSelector{token, parse_union(tokens)};
  default:
    // A missing selection after a descendant segment should have been caught
    // by the lexer.
    throw SyntaxError("bald descendant segment", token);
  }
}

UnionSelector Parser::parse_union(TokenIterator& tokens) const {
  UnionSelector selector{*tokens, {}};
  tokens++; // move past left bracket

  while (tokens->type != TokenType::rbracket) {
    const auto current{*tokens};

    switch (current.type) {
    case TokenType::dq_string:
    case TokenType::sq_string:
      selector.elements.push_back(
          NameElement{current, decode_string_token(current)});
      break;
    case TokenType::index:
      if (std::next(tokens)->type == TokenType::colon) {
        selector.elements.push_back(parse_slice_element(tokens));
      } else {
        selector.elements.push_back(
            IndexElement{current, token_to_int(current)});
      }
      break;
    case TokenType::colon:
      selector.elements.push_back(parse_slice_element(tokens));
      break;
    case TokenType::eof_:
      throw SyntaxError("unexpected end of query", current);
    default:
      throw SyntaxError("unexpected token in bracketed selection '"s +
                            std::string(current.value) + "'"s,
          current);
    }

    if (std::next(tokens)->type != TokenType::rbracket) {
      expect_peek(tokens, TokenType::comma);
      tokens++; // move to comma

      if (std::next(tokens)->type == TokenType::rbracket) {
        throw SyntaxError("unexpected trailing comma", *tokens);
      }
    }

    tokens++; // move past comma or to the right bracket
  }

  if (selector.elements.empty()) {
    throw SyntaxError("empty bracketed segment", selector.token);
  }

  return selector;
}

SliceElement Parser::parse_slice_element(TokenIterator& tokens) const {
  SliceElement element{*tokens, std::nullopt, std::nullopt, std::nullopt};

  if (tokens->type == TokenType::index) {
    element.start = std::optional<std::int64_t>{token_to_int(*tokens)};
    tokens++;
  }

  expect(tokens, TokenType::colon);
  tokens++;

  if (tokens->type == TokenType::index) {
    element.stop = std::optional<std::int64_t>{token_to_int(*tokens)};
    tokens++;
  }

  if (tokens->type == TokenType::colon) {
    tokens++;
    if (tokens->type == TokenType::index) {
      element.step = std::optional<std::int64_t>{token_to_int(*tokens)};
      tokens++;
    }
  }

  // Leave the iterator on the last token of the slice.
  tokens--;
  return element;
}

void Parser::expect(TokenIterator it, TokenType tt) const {
  if (it->type != tt) {
    throw SyntaxError("unexpected token, expected "s +
                          token_type_to_string(tt) + " found "s +
                          token_type_to_string(it->type),
        *it);
  }
}

void Parser::expect_peek(TokenIterator it, TokenType tt) const {
  if (std::next(it)->type != tt) {
    throw SyntaxError("unexpected token, expected "s +
                          token_type_to_string(tt) + " found "s +
                          token_type_to_string(std::next(it)->type),
        *(std::next(it)));
  }
}

std::string Parser::decode_string_token(const Token& t) const {
  return unescape_json_string(t.value, t);
}

std::int64_t Parser::token_to_int(const Token& t) const {
  const auto digits{t.value.starts_with('-') ? t.value.substr(1) : t.value};
  if (digits.size() > 1 && digits.front() == '0') {
    throw SyntaxError("integers with a leading zero are not allowed",
        token_at(t, t.value.size() - digits.size()));
  }

  std::int64_t result{};
  const auto* end{t.value.data() + t.value.size()};
  const auto [ptr, ec] = std::from_chars(t.value.data(), end, result);

  if (ec == std::errc::result_out_of_range) {
    throw SyntaxError("integer out of range", t);
  }

  if (ec != std::errc{} || ptr != end) {
    throw SyntaxError(
        "integer conversion failed for '"s + std::string(t.value) + "'"s, t);
  }

  return result;
}

std::string Parser::unescape_json_string(
    std::string_view sv, const Token& token) const {
  std::string rv{};
  unsigned char byte{};    // current byte
  char escape{};           // the character following a backslash
  std::int32_t code_point; // decoded \uXXXX or \uXXXX\uXXXX escape sequence
  std::string::size_type index{0}; // current byte index in sv
  std::string::size_type start{0}; // index of the current escape or character
  std::string::size_type length{sv.length()};

  while (index < length) {
    start = index;
    byte = sv[index++];

    if (byte == '\\') {
      if (index < length) {
        escape = sv[index++];
      } else {
        throw SyntaxError("invalid escape", token_at(token, start));
      }

      switch (escape) {
      case '"':
        rv.push_back('"');
        break;
      case '\'':
        if (token.type != TokenType::sq_string) {
          throw SyntaxError("invalid escape", token_at(token, start));
        }
        rv.push_back('\'');
        break;
      case '\\':
        rv.push_back('\\');
        break;
      case '/':
        rv.push_back('/');
        break;
      case 'b':
        rv.push_back('\b');
        break;
      case 'f':
        rv.push_back('\f');
        break;
      case 'n':
        rv.push_back('\n');
        break;
      case 'r':
        rv.push_back('\r');
        break;
      case 't':
        rv.push_back('\t');
        break;
      case 'u':
        code_point = decode_hex_char(sv, index, token_at(token, start));
        index += 4;

        if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
          throw SyntaxError("unexpected low surrogate", token_at(token, start));
        }

        // A high surrogate must be followed by a \uXXXX low surrogate.
        if (code_point >= 0xD800 && code_point <= 0xDBFF) {
          if (!(index + 6 <= length && sv[index] == '\\' &&
                  sv[index + 1] == 'u')) {
            throw SyntaxError(
                "unpaired high surrogate", token_at(token, start));
          }

          const auto low_surrogate{
              decode_hex_char(sv, index + 2, token_at(token, index))};
          if (low_surrogate < 0xDC00 || low_surrogate > 0xDFFF) {
            throw SyntaxError("invalid low surrogate", token_at(token, index));
          }

          index += 6;
          code_point = 0x10000 + (((code_point & 0x03FF) << 10) |
                                     (low_surrogate & 0x03FF));
        }

        rv.append(encode_utf8(code_point, token_at(token, start)));
        break;
      default:
        throw SyntaxError("invalid escape", token_at(token, start));
      }

    } else {
      if (byte <= 0x1F) {
        throw SyntaxError(
            "invalid character in string literal", token_at(token, start));
      }

      const auto sequence_length{utf8_sequence_length(sv, start)};
      if (!sequence_length) {
        throw SyntaxError(
            "invalid UTF-8 in string literal", token_at(token, start));
      }

      rv.append(sv.substr(start, sequence_length));
      index = start + sequence_length;
    }
  }

  return rv;
}

std::int32_t Parser::decode_hex_char(std::string_view sv,
    std::string::size_type index, const Token& token) const {
  if (index + 4 > sv.length()) {
    throw SyntaxError("invalid \\uXXXX escape", token);
  }

  std::int32_t code_point{0};
  for (const auto digit : sv.substr(index, 4)) {
    code_point <<= 4;
    if (digit >= '0' && digit <= '9') {
      code_point |= (digit - '0');
    } else if (digit >= 'a' && digit <= 'f') {
      code_point |= (digit - 'a' + 10);
    } else if (digit >= 'A' && digit <= 'F') {
      code_point |= (digit - 'A' + 10);
    } else {
      throw SyntaxError("invalid \\uXXXX escape", token);
    }
  }

  return code_point;
}

std::string Parser::encode_utf8(
    std::int32_t code_point, const Token& token) const {
  std::string rv;

  if (code_point <= 0x7F) {
    // Single-byte UTF-8 encoding for code points up to 7F(hex)
    rv += static_cast<char>(code_point & 0x7F);
  } else if (code_point <= 0x7FF) {
    // Two-byte UTF-8 encoding for code points up to 7FF(hex)
    rv += static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point <= 0xFFFF) {
    // Three-byte UTF-8 encoding for code points up to FFFF(hex)
    rv += static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F));
    rv += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point <= 0x10FFFF) {
    // Four-byte UTF-8 encoding for code points up to 10FFFF(hex)
    rv += static_cast<char>(0xF0 | ((code_point >> 18) & 0x07));
    rv += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    rv += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    rv += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    throw SyntaxError("invalid code point", token);
  }

  return rv;
}

} // namespace libjsonselect
