#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lexer {
/**
 * @brief Raised when a statement cannot be tokenized: unbalanced brackets,
 * braces or parentheses, or an unterminated math region.
 */
class LexError : public std::runtime_error {
public:
  LexError(std::size_t offset, const std::string &reason)
      : std::runtime_error(reason), offset_(offset) {}

  /**
   * @brief Byte offset inside the statement where the problem starts.
   */
  std::size_t GetOffset() const { return offset_; }

private:
  std::size_t offset_;
};
} // namespace lexer
