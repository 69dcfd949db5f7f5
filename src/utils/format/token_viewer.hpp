#pragma once
#include "../../classifier/classifier.hpp"
#include "../../models/token.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace format {
/**
 * @class TokenViewer
 * @brief Prints the tokens of each statement, one per line, under a header
 * naming the statement kind.
 */
class TokenViewer {
public:
  explicit TokenViewer(std::ostream &out);

  /**
   * @brief Prints one statement.
   * @param statement_index Index of the statement in the drawing.
   * @param text The statement text.
   * @param tokens Its tokens.
   * @param kind The kind the classifier chose.
   */
  void view(std::size_t statement_index, std::string_view text,
            const std::vector<models::Token> &tokens,
            classifier::StatementKind kind);

private:
  /**
   * @brief Shortens long statements for the header line.
   */
  static std::string Abbreviate(std::string_view text);

  void doindent();

  std::ostream &out_;
  int indent_ = 0;
};
} // namespace format
