#include "libjsonselect/tokens.hpp"
#include <sstream> // std::ostringstream

namespace libjsonselect {

std::string token_type_to_string(TokenType tt) {
  switch (tt) {
  case TokenType::colon:
    return "COLON";
  case TokenType::comma:
    return "COMMA";
  case TokenType::ddot:
    return "DOTDOT";
  case TokenType::dq_string:
    return "DQ_STRING";
  case TokenType::eof_:
    return "EOF";
  case TokenType::error:
    return "ERROR";
  case TokenType::index:
    return "INDEX";
  case TokenType::lbracket:
    return "LBRACKET";
  case TokenType::name_:
    return "NAME";
  case TokenType::rbracket:
    return "RBRACKET";
  case TokenType::root:
    return "ROOT";
  case TokenType::sq_string:
    return "SQ_STRING";
  case TokenType::wild:
    return "WILD";
  case TokenType::wild_index:
    return "WILD_INDEX";
  default:
    return "UNDEFINED";
  }
}

std::ostream& operator<<(std::ostream& os, TokenType const& tt) {
  return os << token_type_to_string(tt);
}

bool operator==(const Token& lhs, const Token& rhs) {
  return lhs.type == rhs.type && lhs.value == rhs.value &&
         lhs.index == rhs.index && lhs.query == rhs.query;
}

std::string token_to_string(const Token& token) {
  std::ostringstream rv{};
  rv << "Token{type=" << token.type << ", value=\"" << token.value << "\""
     << ", index=" << token.index << "}";
  return rv.str();
}

std::ostream& operator<<(std::ostream& os, Token const& token) {
  return os << token_to_string(token);
}

} // namespace libjsonselect
