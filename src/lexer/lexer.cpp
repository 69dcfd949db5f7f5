#include "lexer.hpp"

#include "helpers.hpp"
#include "names.hpp"
#include <cstdio>
#include <fmt/core.h>

namespace lexer {
Lexer::Lexer(std::string_view statement) : stream_(statement) {}

bool Lexer::Follow(int expected) {
  if (stream_.Peek() == expected) {
    stream_.GetChar();
    return true;
  }
  return false;
}

models::Token Lexer::Make(models::TokenKind kind, std::size_t start) {
  return models::Token{kind, std::string(stream_.Slice(start, stream_.Offset())),
                       start};
}

std::optional<models::Token> Lexer::lex() {
  int curr;
  while (helpers::IsWhitespace(curr = stream_.GetChar())) {
  }
  if (curr == EOF) {
    return std::nullopt;
  }
  std::size_t start = stream_.Offset() - 1;

  switch (curr) {
  case '\\':
    return Command(start);
  case '[':
    return OptionBlock(start);
  case '{':
    return Text(start);
  case '(':
    return Coordinate(start);
  case '+':
    Follow('+');
    if (!Follow('(')) {
      throw LexError(start, "expected '(' after relative prefix");
    }
    return Coordinate(start);
  case '-':
    if (Follow('-') || Follow('|')) {
      return Make(models::TokenKind::kPathOp, start);
    }
    break;
  case '|':
    if (Follow('-')) {
      return Make(models::TokenKind::kPathOp, start);
    }
    break;
  case ';':
    return Make(models::TokenKind::kDelimiter, start);
  default:
    if (helpers::isalpha_(curr)) {
      return Word(start);
    }
    if (helpers::IsClosing(curr)) {
      throw LexError(start, fmt::format("unbalanced '{}'", char(curr)));
    }
    break;
  }
  throw LexError(start, fmt::format("unexpected character '{}'", char(curr)));
}

models::Token Lexer::Command(std::size_t start) {
  std::string name;
  while (helpers::isalpha_(stream_.Peek())) {
    name += static_cast<char>(stream_.GetChar());
  }
  if (name.empty()) {
    throw LexError(start, "expected a command name after '\\'");
  }
  if ((name == "begin" || name == "end") && stream_.Peek() == '{') {
    std::size_t group_start = stream_.Offset();
    stream_.GetChar();
    std::string environment;
    while (helpers::isalpha_(stream_.Peek())) {
      environment += static_cast<char>(stream_.GetChar());
    }
    if (!Follow('}')) {
      throw LexError(group_start, fmt::format("missing '}}' after \\{}", name));
    }
  }
  return Make(models::TokenKind::kKeyword, start);
}

models::Token Lexer::Word(std::size_t start) {
  while (helpers::isalpha_(stream_.Peek())) {
    stream_.GetChar();
  }
  auto word = stream_.Slice(start, stream_.Offset());
  return Make(IsPathWord(word) ? models::TokenKind::kPathOp
                               : models::TokenKind::kKeyword,
              start);
}

models::Token Lexer::OptionBlock(std::size_t start) {
  int brackets = 1;
  int braces = 0;
  bool in_math = false;
  std::size_t math_start = start;
  int curr;
  while ((curr = stream_.GetChar()) != EOF) {
    if (curr == '\\') {
      stream_.GetChar();
    } else if (curr == '$') {
      in_math = !in_math;
      math_start = stream_.Offset() - 1;
    } else if (curr == '{') {
      braces++;
    } else if (curr == '}') {
      if (--braces < 0) {
        throw LexError(stream_.Offset() - 1, "unbalanced '}' in option block");
      }
    } else if (braces == 0 && curr == '[') {
      brackets++;
    } else if (braces == 0 && curr == ']' && --brackets == 0) {
      if (in_math) {
        throw LexError(math_start, "unterminated math in options");
      }
      return Make(models::TokenKind::kOptionBlock, start);
    }
  }
  throw LexError(start, "missing ']' for option block");
}

models::Token Lexer::Text(std::size_t start) {
  int braces = 1;
  bool in_math = false;
  std::size_t math_start = start;
  int curr;
  while ((curr = stream_.GetChar()) != EOF) {
    if (curr == '\\') {
      stream_.GetChar();
    } else if (curr == '$') {
      in_math = !in_math;
      math_start = stream_.Offset() - 1;
    } else if (curr == '{') {
      braces++;
    } else if (curr == '}' && --braces == 0) {
      if (in_math) {
        throw LexError(math_start, "unterminated math in text");
      }
      return Make(models::TokenKind::kText, start);
    }
  }
  throw LexError(start, "missing '}' for text");
}

models::Token Lexer::Coordinate(std::size_t start) {
  int parens = 1;
  int nested = 0;
  int curr;
  while ((curr = stream_.GetChar()) != EOF) {
    if (curr == '\\') {
      stream_.GetChar();
    } else if (curr == '[' || curr == '{') {
      nested++;
    } else if (curr == ']' || curr == '}') {
      if (--nested < 0) {
        throw LexError(stream_.Offset() - 1,
                       fmt::format("unbalanced '{}' in coordinate", char(curr)));
      }
    } else if (nested == 0 && curr == '(') {
      parens++;
    } else if (nested == 0 && curr == ')' && --parens == 0) {
      return Make(models::TokenKind::kCoordinate, start);
    }
  }
  throw LexError(start, "missing ')' for coordinate");
}

std::vector<models::Token> Tokenize(std::string_view statement) {
  Lexer lexer(statement);
  std::vector<models::Token> tokens;
  while (auto token = lexer.lex()) {
    tokens.push_back(std::move(*token));
  }
  return tokens;
}

} // namespace lexer
