#pragma once
namespace lexer::helpers {

int isalpha_(int curr);

bool IsWhitespace(int curr);

/**
 * @brief Characters that close a region opened elsewhere.
 */
bool IsClosing(int curr);
} // namespace lexer::helpers
