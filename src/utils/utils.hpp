#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace utils {
/**
 * @brief Removes leading and trailing whitespace.
 */
std::string Trim(std::string_view s);

/**
 * @brief Trims and replaces every run of inner whitespace by one space.
 *
 * Option keys such as `line   width` and `line width` compare equal after
 * this.
 */
std::string CollapseSpaces(std::string_view s);

/**
 * @brief Splits on a separator that appears outside braces, brackets,
 * parentheses and `$...$` math.
 *
 * A backslash escapes the following character. Every part is trimmed; empty
 * parts are kept so callers can detect `a,,b`.
 *
 * @param s The text to split.
 * @param separator The separator character.
 * @return The parts in source order.
 */
std::vector<std::string> SplitTopLevel(std::string_view s, char separator);

/**
 * @brief Checks that the first and last characters are a matching pair.
 *
 * `{a}{b}` starts with `{` and ends with `}` but is not wrapped.
 */
bool IsWrappedIn(std::string_view s, char open, char close);

/**
 * @brief Removes one pair of enclosing braces when the whole text is wrapped.
 */
std::string StripOuterBraces(std::string_view s);

/**
 * @brief Rounds to three decimals and turns a negative zero into zero.
 */
double Round3(double value);
} // namespace utils
