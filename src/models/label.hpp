#pragma once

#include "models_fwd.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace models {
/**
 * @struct Label
 * Structure representing free-form text attached to an element.
 */
struct Label {
  std::string value;                    /**< Normalized text, math kept. */
  std::optional<std::string> font_size; /**< `\small`, `\Large`, ... */
  std::optional<std::string> color;     /**< From `\textcolor{...}`. */
  std::optional<std::string> anchor;    /**< `anchor=` of a chained node. */
  std::optional<std::string> distance;  /**< Distance from the element. */
  bool other_side = false;              /**< Placed with `l_=`. */

  bool operator==(const Label &other) const {
    return value == other.value && font_size == other.font_size &&
           color == other.color && anchor == other.anchor &&
           distance == other.distance && other_side == other.other_side;
  }
};

/**
 * @brief Normalizes label text.
 *
 * Turns a `\\` line break outside math into a newline and trims.
 * Everything else, braces and math included, is kept verbatim.
 */
std::string NormalizeLabelText(std::string_view raw);

/**
 * @brief Builds a label, pulling a leading `\textcolor{rgb,...}{...}` wrapper
 * and a leading font-size command out of the text.
 * @param raw Label text with balanced braces, its delimiting braces already
 * removed. A group wrapping the whole text is kept unless it only scopes a
 * font-size command.
 */
Label MakeLabel(std::string_view raw);

/**
 * @brief Converts `rgb,255:red,R;green,G;blue,B` to `rgb(R,G,B)`.
 *
 * Other color names are returned trimmed and unchanged.
 */
std::string ConvertColor(std::string_view color);

} // namespace models
