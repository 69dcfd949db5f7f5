#pragma once

#include "coordinate.hpp"
#include "label.hpp"
#include "option_set.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace models {

enum class ElementKind { kNode, kWire, kComponent, kGroup };

/**
 * @struct PathPoint
 * One point of a path, optionally labelled by an inline `node`.
 */
struct PathPoint {
  Coordinate coordinate;
  std::optional<Label> label;
};

/**
 * @struct Node
 * A device, outline shape, text node or named coordinate at one position.
 */
struct Node {
  Coordinate position;             /**< Where the node is placed. */
  OptionSet options;               /**< Options of the main node part. */
  std::optional<std::string> name; /**< Name usable as a back-reference. */
  std::string shape;               /**< Device or shape name, may be empty. */
  bool is_shape = false;           /**< Outline shape (`shape=...`). */
  bool is_coordinate = false;      /**< `\coordinate`, a named point only. */
  std::optional<Label> label;      /**< Label next to the node. */
  std::optional<Label> text;       /**< Text inside an outline shape. */
};

/**
 * @struct Wire
 * A run of two or more connected path points.
 */
struct Wire {
  std::vector<PathPoint> points;       /**< Path points in drawing order. */
  std::vector<std::string> directions; /**< Operator between point i and i+1. */
  OptionSet options;                   /**< Options shared by the whole run. */
  bool drawn = true;                   /**< False for `\path`. */
};

/**
 * @struct Component
 * A two-terminal circuit element placed with `to[...]`.
 */
struct Component {
  std::string type;                /**< `R`, `C`, `cute inductor`, ... */
  std::vector<PathPoint> terminals; /**< Start and end terminal. */
  OptionSet options;               /**< Path options merged with `to[...]`. */
  std::optional<Label> label;      /**< `l=`, `l_=` or `R=...` label. */
  std::optional<std::string> name; /**< `name=` option. */
};

/**
 * @struct Group
 * A scope with its own namespace for named points.
 */
struct Group {
  std::string name;  /**< `name=` option or a generated name. */
  OptionSet options; /**< Options of `\begin{scope}[...]`. */
  std::size_t scope = 0; /**< Id of the namespace opened by the group. */
  bool closed = false;   /**< Matched by an `\end{scope}`. */
};

/**
 * @struct Element
 * Structure representing one unit of output owned by the document.
 */
struct Element {
  std::variant<Node, Wire, Component, Group> body; /**< Variant payload. */
  std::string id;                  /**< Assigned by the assembler. */
  std::size_t statement_index = 0; /**< Statement that produced it. */
  std::optional<std::size_t> group; /**< Index of the enclosing group. */
  std::vector<std::size_t> visible_scopes; /**< Namespaces, innermost first. */

  ElementKind Kind() const { return static_cast<ElementKind>(body.index()); }

  /**
   * @brief Coordinates in resolution order: a node's position, a wire's
   * points, a component's terminals. Groups have none.
   */
  std::vector<Coordinate *> Coordinates();
  std::vector<const Coordinate *> Coordinates() const;
};

/**
 * @brief The `"type"` discriminator written for an element kind.
 */
std::string_view ToString(ElementKind kind);

} // namespace models
