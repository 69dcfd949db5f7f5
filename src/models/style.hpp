#pragma once

#include "coordinate.hpp"
#include "option_set.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace models {

/**
 * @struct Stroke
 * Line appearance in the editor's vocabulary.
 */
struct Stroke {
  std::optional<std::string> width;   /**< `line width`, e.g. `1.3pt`. */
  std::optional<std::string> opacity; /**< `draw opacity`. */
  std::optional<std::string> style;   /**< Named dash style. */
  std::optional<std::string> color;   /**< `rgb(r,g,b)` or a color name. */
  bool hidden = false;                /**< Outline not drawn at all. */
};

/**
 * @struct Fill
 * Area appearance of a shape.
 */
struct Fill {
  std::optional<std::string> color;
  std::optional<std::string> opacity;
};

/**
 * @struct Transform
 * Rotation in degrees and axis scale factors of a placed symbol.
 */
struct Transform {
  std::optional<double> rotation;
  std::optional<Point> scale;
};

/**
 * @struct Tips
 * What is drawn at the two ends of a path or component.
 */
struct Tips {
  std::optional<std::string> start;
  std::optional<std::string> end;
};

/**
 * @brief Reads stroke options.
 *
 * @param options Merged options of the element.
 * @param drawn_by_default True for `\draw` paths, false for nodes which are
 * only outlined with an explicit `draw`.
 * @param warnings Receives one message per option that could not be
 * converted (the stroke then falls back to a solid line).
 * @return The stroke; `hidden` is set when nothing is drawn.
 */
Stroke ParseStroke(const OptionSet &options, bool drawn_by_default,
                   std::vector<std::string> &warnings);

/**
 * @brief Reads `fill`, `fill={rgb...}` and `fill opacity`.
 * @return std::nullopt when the options do not fill.
 */
std::optional<Fill> ParseFill(const OptionSet &options);

/**
 * @brief Maps `rotate`, `xscale` and `yscale` onto the editor's transform.
 *
 * A lone `xscale` becomes a -180 rotation with both scales negated, a lone
 * `yscale` negates the x scale, and an explicit `rotate` is copied as is.
 */
Transform ParseTransform(const OptionSet &options);

/**
 * @brief Scale produced by the `mirror` and `invert` flags of a component.
 */
std::optional<Point> ParseMirrorInvert(const OptionSet &options);

/**
 * @brief Arrow tips from a `start-end` flag such as `-stealth` or `latex-`.
 */
Tips ParseArrows(const OptionSet &options, std::vector<std::string> &warnings);

/**
 * @brief Terminal dots from a shorthand such as `*-o` or `-o`.
 */
Tips ParseTerminals(const OptionSet &options);

/**
 * @brief Divides each `<n>pt` of a dash pattern by the line width.
 *
 * `on 2.8pt off 0.7pt` with a width of 0.7 becomes `on 4pt off 1pt`.
 */
std::string NormalizeDashPattern(std::string_view pattern, double line_width);

/**
 * @brief `minimum width` and `minimum height` in centimetres.
 *
 * A missing height copies the width; negative widths are clamped to 0.
 */
std::optional<Point> ParseShapeSize(const OptionSet &options);

} // namespace models
