#pragma once

#include <cstddef>
#include <string_view>

namespace lexer {
/**
 * @brief Class representing a character stream over one statement.
 */
class CharStream {
public:
  /**
   * @brief Constructs a stream over text that must outlive the stream.
   */
  explicit CharStream(std::string_view text);

  /**
   * @brief Gets the next character from the stream.
   * @return The next character, or EOF at the end of the text.
   */
  int GetChar();

  /**
   * @brief Looks at the next character without consuming it.
   * @return The character, or EOF at the end of the text.
   */
  int Peek() const;

  /**
   * @brief Offset of the next character to be read.
   */
  std::size_t Offset() const { return pos_; }

  /**
   * @brief Text between two offsets.
   */
  std::string_view Slice(std::size_t begin, std::size_t end) const {
    return text_.substr(begin, end - begin);
  }

private:
  std::string_view text_; /**< The statement being read. */
  std::size_t pos_;       /**< Offset of the next character. */
};

} // namespace lexer
