#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace document {

enum class DiagnosticKind {
  kLexError,
  kUnrecognized,
  kUnresolvedReference,
  kStructural,
  kUnsupported,
  kStyle
};

/**
 * @struct Diagnostic
 * One warning about a statement or an element that was skipped, dropped or
 * only partly converted.
 */
struct Diagnostic {
  std::size_t statement_index; /**< Zero-based index of the statement. */
  std::size_t offset;          /**< Byte offset inside the statement. */
  DiagnosticKind kind;
  std::string message;
};

std::string_view ToString(DiagnosticKind kind);

/**
 * @brief One-line rendering, e.g. `statement 3, offset 12: LexError: ...`.
 */
std::string Describe(const Diagnostic &diagnostic);

} // namespace document
