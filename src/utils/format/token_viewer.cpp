#include "token_viewer.hpp"

#include <fmt/core.h>

namespace format {
namespace {
constexpr std::size_t kHeaderWidth = 60;
}

TokenViewer::TokenViewer(std::ostream &out) : out_(out) {}

void TokenViewer::doindent() {
  for (int i = 0; i < indent_; i++) {
    out_ << "   ";
  }
}

std::string TokenViewer::Abbreviate(std::string_view text) {
  std::string line;
  for (char c : text) {
    line += (c == '\n' || c == '\t') ? ' ' : c;
  }
  if (line.size() > kHeaderWidth) {
    line = line.substr(0, kHeaderWidth - 3) + "...";
  }
  return line;
}

void TokenViewer::view(std::size_t statement_index, std::string_view text,
                       const std::vector<models::Token> &tokens,
                       classifier::StatementKind kind) {
  if (kind == classifier::StatementKind::kGroupClose && indent_ > 0) {
    indent_--;
  }
  doindent();
  out_ << fmt::format("#{} {}: {}", statement_index,
                      classifier::ToString(kind), Abbreviate(text))
       << std::endl;
  for (const auto &token : tokens) {
    doindent();
    out_ << fmt::format("  {:>4}  {:<11} {}", token.offset,
                        models::ToString(token.kind), token.lexeme)
         << std::endl;
  }
  if (kind == classifier::StatementKind::kGroupOpen) {
    indent_++;
  }
}
} // namespace format
