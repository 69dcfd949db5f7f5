#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace builder {
/**
 * @class ScopeProcessor
 * @brief Manages the namespaces opened by `\begin{scope}`.
 *
 * Scope 0 is the document scope and is never removed. Every AddScope call
 * hands out a new id, so a group that is closed and a sibling opened later
 * never share a namespace.
 */
class ScopeProcessor {
public:
  ScopeProcessor();

  /**
   * @brief Opens a new scope inside the current one.
   * @return The id of the new scope.
   */
  std::size_t AddScope();

  /**
   * @brief Closes the current scope.
   * @return The id of the closed scope, or std::nullopt when only the
   * document scope is open.
   */
  std::optional<std::size_t> RemoveScope();

  /**
   * @brief Closes every scope above the document scope.
   * @return The ids of the closed scopes, innermost first.
   */
  std::vector<std::size_t> ForceClose();

  /**
   * @brief Gets the id of the current scope.
   */
  std::size_t GetCurrScope() const { return stack_.back(); }

  /**
   * @brief Gets the open scopes, innermost first.
   */
  std::vector<std::size_t> GetVisibleScopes() const;

private:
  std::vector<std::size_t> stack_; /**< Open scopes, document scope first. */
  std::size_t next_id_;            /**< Id handed out by the next AddScope. */
};

} // namespace builder
