#include "helpers.hpp"

#include <ctype.h>

namespace lexer::helpers {

int isalpha_(int curr) { return curr >= 0 && curr < 256 && isalpha(curr); }

bool IsWhitespace(int curr) {
  return curr == ' ' || curr == '\t' || curr == '\f' || curr == '\n' ||
         curr == '\r';
}

bool IsClosing(int curr) { return curr == ']' || curr == '}' || curr == ')'; }

} // namespace lexer::helpers
