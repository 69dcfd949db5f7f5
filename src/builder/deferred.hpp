#pragma once

#include "../document/document.hpp"
#include "name_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace builder {

/**
 * @class DeferredResolver
 * @brief Second pass resolving every coordinate once all names are known.
 *
 * Elements are resolved on demand, so a reference may point at an element
 * declared later in a visible scope. An element whose coordinates cannot be
 * resolved is removed from the document with exactly one
 * UnresolvedReference diagnostic; elements that depend on it are removed
 * the same way.
 */
class DeferredResolver {
public:
  DeferredResolver(document::Document &document, NameTable &names);

  /**
   * @brief Resolves every element and removes the ones that failed.
   * @return The number of removed elements.
   */
  std::size_t ResolveAll();

private:
  enum class State { kPending, kInProgress, kDone, kFailed };

  /**
   * @brief Resolves the coordinates of one element.
   * @return False if the element failed, now or earlier.
   */
  bool Resolve(std::size_t index);

  /**
   * @brief Resolves the coordinates of an element in order.
   * @throws UnresolvedReferenceError
   */
  void ResolvePoints(std::size_t index);

  /**
   * @brief Position of a name as seen from an element.
   * @throws UnresolvedReferenceError
   */
  models::Point Locate(const models::Coordinate &coordinate,
                       std::size_t referrer);

  /**
   * @brief Removes failed elements and renumbers group and name indices.
   */
  std::size_t Drop();

  document::Document &document_;
  NameTable &names_;
  std::vector<State> states_;
};

} // namespace builder
