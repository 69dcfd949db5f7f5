#include "token.hpp"

namespace models {

std::string Token::Body() const {
  switch (kind) {
  case TokenKind::kOptionBlock:
  case TokenKind::kText:
    if (lexeme.size() >= 2) {
      return lexeme.substr(1, lexeme.size() - 2);
    }
    return "";
  case TokenKind::kCoordinate: {
    auto open = lexeme.find('(');
    if (open == std::string::npos || lexeme.size() < open + 2) {
      return "";
    }
    return lexeme.substr(open + 1, lexeme.size() - open - 2);
  }
  default:
    return lexeme;
  }
}

bool Token::Is(TokenKind other_kind, std::string_view text) const {
  return kind == other_kind && lexeme == text;
}

bool Token::IsRelative() const {
  return kind == TokenKind::kCoordinate && !lexeme.empty() && lexeme[0] == '+';
}

std::string_view ToString(TokenKind kind) {
  switch (kind) {
  case TokenKind::kKeyword:
    return "keyword";
  case TokenKind::kCoordinate:
    return "coordinate";
  case TokenKind::kOptionBlock:
    return "options";
  case TokenKind::kText:
    return "text";
  case TokenKind::kPathOp:
    return "path-op";
  case TokenKind::kDelimiter:
    return "delimiter";
  }
  return "unknown";
}

} // namespace models
