#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace builder {

/**
 * @struct NameTarget
 * What a name points at: a whole element, or one point of a path.
 */
struct NameTarget {
  std::size_t element;              /**< Index into the document elements. */
  std::optional<std::size_t> point; /**< Point of a wire named inline. */
  std::size_t statement_index = 0;  /**< Statement that declared the name. */
};

/**
 * @class NameTable
 * @brief Names declared by nodes, components and inline coordinates, keyed
 * by the scope they were declared in.
 *
 * A name may be declared again in the same scope. Every declaration is kept
 * in statement order, and a reference binds to the latest declaration made
 * at or before its own statement.
 */
class NameTable {
public:
  void Declare(std::size_t scope, const std::string &name, NameTarget target);

  /**
   * @brief Looks a name up through the given scopes.
   * @param visible_scopes Scopes to search, innermost first.
   * @param statement_index Statement of the reference; std::nullopt means
   * after every statement.
   * @return The latest declaration at or before the statement, innermost
   * scope first. Without one, the earliest later declaration. Otherwise
   * std::nullopt.
   */
  std::optional<NameTarget>
  Lookup(const std::string &name,
         const std::vector<std::size_t> &visible_scopes,
         std::optional<std::size_t> statement_index = std::nullopt) const;

  /**
   * @brief Renumbers targets after elements were removed.
   * @param remap New index of every old element, std::nullopt if removed.
   */
  void Remap(const std::vector<std::optional<std::size_t>> &remap);

  /**
   * @brief Number of distinct (scope, name) pairs.
   */
  std::size_t Size() const { return names_.size(); }

private:
  std::map<std::pair<std::size_t, std::string>, std::vector<NameTarget>>
      names_;
};

} // namespace builder
