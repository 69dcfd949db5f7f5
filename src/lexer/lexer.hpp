#pragma once
#include "../models/token.hpp"
#include "char_stream.hpp"
#include "lex_error.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexer {
/**
 * @brief Class responsible for lexical analysis of one drawing statement.
 *
 * Bracket, brace and parenthesis regions are read by a depth-tracking
 * scanner and become a single token each, so commas, semicolons and math
 * inside them never split anything. The sequence is produced once and
 * cannot be restarted.
 */
class Lexer {
public:
  /**
   * @brief Constructs a lexer over a statement that must outlive it.
   * @param statement One statement, with or without its trailing `;`.
   */
  explicit Lexer(std::string_view statement);

  /**
   * @brief Performs lexical analysis of the next token.
   * @return The next token, or std::nullopt at the end of the statement.
   * @throws LexError on unbalanced delimiters, unterminated math or a
   * character outside the dialect.
   */
  std::optional<models::Token> lex();

private:
  /**
   * @brief Reads `\name`, or `\begin{scope}` / `\end{scope}` as one keyword.
   * @param start Offset of the backslash.
   */
  models::Token Command(std::size_t start);

  /**
   * @brief Reads a bare word: `node`, `at`, `to`, `coordinate`, `cycle`.
   */
  models::Token Word(std::size_t start);

  /**
   * @brief Reads an option block up to its matching `]`.
   */
  models::Token OptionBlock(std::size_t start);

  /**
   * @brief Reads a brace group up to its matching `}`, tracking math.
   */
  models::Token Text(std::size_t start);

  /**
   * @brief Reads a coordinate up to its matching `)`.
   * @param start Offset of the first character, `+` prefix included.
   */
  models::Token Coordinate(std::size_t start);

  /**
   * @brief Consumes the next character when it equals `expected`.
   * @return True if the character was consumed.
   */
  bool Follow(int expected);

  /**
   * @brief Builds a token from `start` to the current offset.
   */
  models::Token Make(models::TokenKind kind, std::size_t start);

  CharStream stream_; /**< The statement being scanned. */
};

/**
 * @brief Tokenizes a whole statement.
 * @throws LexError as Lexer::lex does.
 */
std::vector<models::Token> Tokenize(std::string_view statement);

} // namespace lexer
