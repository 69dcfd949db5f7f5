#pragma once

#include "models_fwd.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace models {

enum class TokenKind {
  kKeyword,
  kCoordinate,
  kOptionBlock,
  kText,
  kPathOp,
  kDelimiter
};

/**
 * @struct Token
 * Structure representing a lexical token of one drawing statement.
 */
struct Token {
  TokenKind kind;     /**< Token type. */
  std::string lexeme; /**< Raw source text, delimiters included. */
  std::size_t offset; /**< Byte offset inside the statement. */

  /**
   * @brief Returns the lexeme without its enclosing delimiters.
   *
   * Option blocks lose their brackets, text loses its braces and
   * coordinates lose the relative prefix and the parentheses.
   */
  std::string Body() const;

  /**
   * @brief Checks the token kind and its exact lexeme.
   */
  bool Is(TokenKind other_kind, std::string_view text) const;

  /**
   * @brief Checks whether a coordinate token carries a `+` or `++` prefix.
   */
  bool IsRelative() const;
};

/**
 * @brief Human readable name of a token kind.
 */
std::string_view ToString(TokenKind kind);

} // namespace models
