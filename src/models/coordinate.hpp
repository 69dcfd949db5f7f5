#pragma once

#include "models_fwd.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace models {

/**
 * @struct Point
 * A position or offset in centimetres, y pointing up.
 */
struct Point {
  double x = 0.0;
  double y = 0.0;

  Point operator+(const Point &other) const { return {x + other.x, y + other.y}; }
  bool operator==(const Point &other) const {
    return x == other.x && y == other.y;
  }
};

enum class CoordinateKind { kAbsolute, kNamed, kRelative };

/**
 * @struct Coordinate
 * A point as written in the markup, resolved later against the name table
 * and the current point of its statement.
 */
struct Coordinate {
  CoordinateKind kind = CoordinateKind::kAbsolute; /**< How to resolve it. */
  Point value;        /**< Absolute position or relative offset. */
  std::string name;   /**< Referenced name, kNamed only. */
  std::string anchor; /**< Anchor after the dot (`X1.north east`). */
  Point shift;        /**< `[xshift=..., yshift=...]` modifier. */
  std::size_t offset = 0;        /**< Source offset inside the statement. */
  std::optional<Point> resolved; /**< Filled by the resolution pass. */
};

/**
 * @brief Parses a length with an optional unit into centimetres.
 *
 * Bare numbers are centimetres; `cm`, `mm`, `pt`, `bp` and `in` are
 * recognised.
 *
 * @param text The length, e.g. `1.5`, `-2mm`, `10pt`.
 * @return The length in centimetres, or std::nullopt if it is not a length.
 */
std::optional<double> ParseLength(std::string_view text);

/**
 * @brief Builds a coordinate from a coordinate token.
 *
 * Accepts `(x,y)`, `+(dx,dy)`, `++(dx,dy)`, `(name)`, `(name.anchor)` and a
 * leading `[xshift=..,yshift=..]` inside the parentheses.
 *
 * @param token A token of kind kCoordinate.
 * @return The coordinate, or std::nullopt for unsupported forms such as polar
 * coordinates or a relative name.
 */
std::optional<Coordinate> ParseCoordinate(const Token &token);

/**
 * @brief Checks that a coordinate token only holds a plain identifier.
 *
 * `\node (A) at ...` uses this form to declare a name.
 */
std::optional<std::string> ParseNameDeclaration(const Token &token);

} // namespace models
