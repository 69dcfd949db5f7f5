#pragma once

#include "../classifier/classifier.hpp"
#include "../document/document.hpp"
#include "../models/token.hpp"
#include "name_table.hpp"
#include "scope.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace builder {

/**
 * @class SemanticBuilder
 * @brief Turns classified statements into document elements.
 *
 * Each statement is built into a private buffer first and committed only
 * when the whole statement succeeded, so a failing statement leaves the
 * document, the name table and the open groups untouched. Coordinates stay
 * unresolved until Finish runs the deferred pass.
 */
class SemanticBuilder {
public:
  explicit SemanticBuilder(document::Document &document);

  /**
   * @brief Builds the elements of one statement.
   * @param statement_index Index of the statement in the drawing.
   * @param kind The kind returned by the classifier.
   * @param tokens The statement tokens.
   * @throws BuildError for constructs outside the supported dialect.
   */
  void Build(std::size_t statement_index, classifier::StatementKind kind,
             const std::vector<models::Token> &tokens);

  /**
   * @brief Force-closes groups left open and resolves every coordinate.
   *
   * Must be called once, after the last statement.
   */
  void Finish();

  const NameTable &GetNames() const { return names_; }
  const ScopeProcessor &GetScopes() const { return scopes_; }

private:
  /**
   * @struct Pending
   * Elements of one statement and the names they declare, indices local to
   * the statement.
   */
  struct Pending {
    std::vector<models::Element> elements;
    std::vector<std::pair<std::string, NameTarget>> names;
  };

  void OpenGroup(std::size_t statement_index,
                 const std::vector<models::Token> &tokens);
  void CloseGroup(std::size_t statement_index,
                  const std::vector<models::Token> &tokens);
  Pending BuildNodes(const std::vector<models::Token> &tokens) const;
  Pending BuildPath(const std::vector<models::Token> &tokens) const;

  /**
   * @brief Appends pending elements to the document and declares their
   * names in the current scope.
   */
  void Commit(std::size_t statement_index, Pending pending);

  document::Document &document_;
  ScopeProcessor scopes_;
  NameTable names_;
  std::vector<std::size_t> open_groups_; /**< Element indices of open groups. */
  std::size_t groups_seen_;
  bool finished_;
};

} // namespace builder
