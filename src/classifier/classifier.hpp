#pragma once

#include "../models/token.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace models {
class OptionSet;
}

namespace classifier {

enum class StatementKind {
  kStandaloneNode,
  kSimpleWire,
  kMultiSegmentPath,
  kComponentOnPath,
  kGroupOpen,
  kGroupClose,
  kUnrecognized
};

/**
 * @struct Features
 * What the classification rules look at: the leading command and the path
 * operators of a statement.
 */
struct Features {
  std::optional<models::Token> command; /**< First token if it is a keyword. */
  int path_ops = 0;                     /**< Number of PathOp tokens. */
  int coordinates = 0;                  /**< Number of Coordinate tokens. */
  bool has_node_part = false;           /**< A `node` keyword appears. */
  bool first_to_names_component = false; /**< `to[...]` names a bipole. */
};

/**
 * @struct Rule
 * One entry of the priority list. The first rule whose predicate holds
 * decides the kind.
 */
struct Rule {
  StatementKind kind;
  std::string_view description;
  std::function<bool(const Features &)> matches;
};

/**
 * @brief Collects the features of a token sequence.
 */
Features Inspect(const std::vector<models::Token> &tokens);

/**
 * @brief The ordered rule list, highest priority first.
 */
const std::vector<Rule> &Rules();

/**
 * @brief Classifies a tokenized statement.
 *
 * Deterministic and side-effect free; a statement no rule accepts is
 * kUnrecognized.
 */
StatementKind Classify(const std::vector<models::Token> &tokens);

/**
 * @brief The description of the rule that accepts the statement.
 */
std::string_view Explain(const std::vector<models::Token> &tokens);

/**
 * @brief The component named by an option block: the first key, flag or
 * `key=value`, that is a known two-terminal component.
 */
std::optional<std::string> ComponentType(const models::OptionSet &options);

std::string_view ToString(StatementKind kind);

} // namespace classifier
