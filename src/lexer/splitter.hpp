#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexer {

/**
 * @struct Statement
 * One top-level command sliced out of a drawing body.
 */
struct Statement {
  std::string text; /**< Statement text, trailing `;` included if present. */
};

/**
 * @brief Removes `%` comments. An escaped `\%` is kept.
 */
std::string RemoveComments(std::string_view source);

/**
 * @brief Extracts the body of the first `circuitikz` or `tikzpicture`
 * environment.
 * @return The text between the begin and end markers, or std::nullopt when
 * no complete environment is present.
 */
std::optional<std::string> ExtractDrawingBody(std::string_view source);

/**
 * @brief Slices a drawing body into statements.
 *
 * A statement ends at a `;` outside braces and brackets. `\begin{scope}`
 * with its option block and `\end{scope}` are statements of their own.
 * When a statement command appears while a bracket or parenthesis is still
 * open, or starts a line while a brace is still open, the unterminated text
 * is closed there so that one malformed statement does not swallow the ones
 * after it. Blank statements are dropped.
 */
std::vector<Statement> SplitStatements(std::string_view body);

} // namespace lexer
