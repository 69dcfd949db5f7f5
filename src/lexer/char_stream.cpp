#include "char_stream.hpp"

#include <cstdio>

namespace lexer {
CharStream::CharStream(std::string_view text) : text_(text), pos_(0) {}

int CharStream::GetChar() {
  if (pos_ >= text_.size()) {
    pos_ = text_.size() + 1;
    return EOF;
  }
  return static_cast<unsigned char>(text_[pos_++]);
}

int CharStream::Peek() const {
  if (pos_ >= text_.size()) {
    return EOF;
  }
  return static_cast<unsigned char>(text_[pos_]);
}

} // namespace lexer
