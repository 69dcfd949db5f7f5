#include "diagnostic.hpp"

#include <fmt/core.h>

namespace document {

std::string_view ToString(DiagnosticKind kind) {
  switch (kind) {
  case DiagnosticKind::kLexError:
    return "LexError";
  case DiagnosticKind::kUnrecognized:
    return "Unrecognized";
  case DiagnosticKind::kUnresolvedReference:
    return "UnresolvedReference";
  case DiagnosticKind::kStructural:
    return "Structural";
  case DiagnosticKind::kUnsupported:
    return "Unsupported";
  case DiagnosticKind::kStyle:
    return "Style";
  }
  return "Unknown";
}

std::string Describe(const Diagnostic &diagnostic) {
  return fmt::format("statement {}, offset {}: {}: {}",
                     diagnostic.statement_index, diagnostic.offset,
                     ToString(diagnostic.kind), diagnostic.message);
}

} // namespace document
