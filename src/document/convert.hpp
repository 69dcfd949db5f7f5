#pragma once

#include "../classifier/classifier.hpp"
#include "../models/token.hpp"
#include "assembler.hpp"
#include "diagnostic.hpp"

#include <functional>
#include <json/json.h>
#include <string_view>
#include <vector>

namespace document {

/**
 * @struct ConversionResult
 * The JSON document of one drawing and every diagnostic produced on the
 * way. The document is always present, possibly with no elements.
 */
struct ConversionResult {
  Json::Value document;
  std::vector<Diagnostic> diagnostics;
};

/**
 * @brief Called for each statement that tokenized, before it is built.
 */
using StatementObserver =
    std::function<void(std::size_t statement_index, std::string_view text,
                       const std::vector<models::Token> &tokens,
                       classifier::StatementKind kind)>;

/**
 * @brief Converts the body of one drawing environment.
 *
 * Splits, tokenizes, classifies and builds every statement in source order,
 * resolves named coordinates and assembles the result. No error aborts the
 * conversion; each skipped statement or dropped element yields exactly one
 * diagnostic.
 *
 * @param body Text between `\begin{circuitikz}` and `\end{circuitikz}`.
 * @param options Output units.
 * @param observer Optional hook, e.g. for a token dump.
 */
ConversionResult Convert(std::string_view body,
                         const JsonOptions &options = JsonOptions{},
                         const StatementObserver &observer = nullptr);

} // namespace document
