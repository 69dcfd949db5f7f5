#pragma once

#include <optional>
#include <string_view>

namespace lexer {

/**
 * @brief Statement-leading commands of the dialect.
 */
enum class Command { kDraw, kPath, kNode, kCoordinate, kBeginScope, kEndScope };

constexpr std::string_view kNodeKeyword = "node";
constexpr std::string_view kAtKeyword = "at";
constexpr std::string_view kCoordinateKeyword = "coordinate";
constexpr std::string_view kCycleKeyword = "cycle";
constexpr std::string_view kToOperator = "to";

/**
 * @brief Parses a command keyword such as `\draw` or `\begin{scope}`.
 * @return The command, or std::nullopt for commands outside the dialect.
 */
std::optional<Command> ParseCommand(std::string_view lexeme);

/**
 * @brief Checks whether a bare word is a path operator (`to`).
 */
bool IsPathWord(std::string_view word);

/**
 * @brief Checks whether an option key names a two-terminal CircuiTikZ
 * component (`R`, `cute inductor`, `american voltage source`, ...).
 */
bool IsKnownComponent(std::string_view key);

} // namespace lexer
