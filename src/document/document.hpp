#pragma once

#include "../models/element.hpp"
#include "diagnostic.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace document {
/**
 * @struct Document
 * Elements of one drawing in submission order, plus everything reported
 * while building them. Group membership is an index into `elements`.
 */
struct Document {
  std::vector<models::Element> elements;
  std::vector<Diagnostic> diagnostics;

  void Report(std::size_t statement_index, std::size_t offset,
              DiagnosticKind kind, std::string message) {
    diagnostics.push_back(
        Diagnostic{statement_index, offset, kind, std::move(message)});
  }
};
} // namespace document
