#include "convert.hpp"

#include "../builder/build_error.hpp"
#include "../builder/builder.hpp"
#include "../lexer/lexer.hpp"
#include "../lexer/splitter.hpp"
#include "document.hpp"
#include <fmt/core.h>

namespace document {

ConversionResult Convert(std::string_view body, const JsonOptions &options,
                         const StatementObserver &observer) {
  Document document;
  builder::SemanticBuilder semantic_builder(document);

  auto statements = lexer::SplitStatements(body);
  for (std::size_t index = 0; index < statements.size(); index++) {
    const auto &statement = statements[index];
    std::vector<models::Token> tokens;
    try {
      tokens = lexer::Tokenize(statement.text);
    } catch (const lexer::LexError &error) {
      document.Report(index, error.GetOffset(), DiagnosticKind::kLexError,
                      error.what());
      continue;
    }
    if (tokens.empty()) {
      continue;
    }

    auto kind = classifier::Classify(tokens);
    if (observer) {
      observer(index, statement.text, tokens, kind);
    }
    if (kind == classifier::StatementKind::kUnrecognized) {
      document.Report(index, tokens.front().offset,
                      DiagnosticKind::kUnrecognized,
                      fmt::format("'{}' statement is not supported, skipped",
                                  tokens.front().lexeme));
      continue;
    }

    try {
      semantic_builder.Build(index, kind, tokens);
    } catch (const builder::BuildError &error) {
      document.Report(index, error.GetOffset(), DiagnosticKind::kUnsupported,
                      error.what());
    }
  }
  semantic_builder.Finish();

  DocumentAssembler assembler(options);
  ConversionResult result;
  result.document = assembler.Assemble(document);
  result.diagnostics = std::move(document.diagnostics);
  return result;
}

} // namespace document
