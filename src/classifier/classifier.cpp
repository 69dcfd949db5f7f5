#include "classifier.hpp"

#include "../lexer/names.hpp"
#include "../models/option_set.hpp"

#include <initializer_list>

namespace classifier {

namespace {
bool IsCommand(const Features &features,
               std::initializer_list<lexer::Command> commands) {
  if (!features.command.has_value()) {
    return false;
  }
  auto command = lexer::ParseCommand(features.command->lexeme);
  if (!command.has_value()) {
    return false;
  }
  for (auto expected : commands) {
    if (*command == expected) {
      return true;
    }
  }
  return false;
}

bool IsPathCommand(const Features &features) {
  return IsCommand(features, {lexer::Command::kDraw, lexer::Command::kPath});
}
} // namespace

Features Inspect(const std::vector<models::Token> &tokens) {
  Features features;
  if (!tokens.empty() && tokens.front().kind == models::TokenKind::kKeyword) {
    features.command = tokens.front();
  }
  bool seen_to = false;
  for (std::size_t i = 0; i < tokens.size(); i++) {
    const auto &token = tokens[i];
    switch (token.kind) {
    case models::TokenKind::kPathOp:
      features.path_ops++;
      if (!seen_to && token.lexeme == lexer::kToOperator) {
        seen_to = true;
        if (i + 1 < tokens.size() &&
            tokens[i + 1].kind == models::TokenKind::kOptionBlock) {
          auto options = models::OptionSet::Parse(tokens[i + 1].Body());
          features.first_to_names_component =
              ComponentType(options).has_value();
        }
      }
      break;
    case models::TokenKind::kCoordinate:
      features.coordinates++;
      break;
    case models::TokenKind::kKeyword:
      if (token.lexeme == lexer::kNodeKeyword) {
        features.has_node_part = true;
      }
      break;
    default:
      break;
    }
  }
  return features;
}

const std::vector<Rule> &Rules() {
  static const std::vector<Rule> rules{
      {StatementKind::kGroupOpen, "\\begin{scope}",
       [](const Features &f) {
         return IsCommand(f, {lexer::Command::kBeginScope});
       }},
      {StatementKind::kGroupClose, "\\end{scope}",
       [](const Features &f) {
         return IsCommand(f, {lexer::Command::kEndScope});
       }},
      {StatementKind::kStandaloneNode, "\\node or \\coordinate without a path",
       [](const Features &f) {
         return IsCommand(f, {lexer::Command::kNode,
                              lexer::Command::kCoordinate}) &&
                f.path_ops == 0;
       }},
      {StatementKind::kStandaloneNode, "path holding only node parts",
       [](const Features &f) {
         return IsPathCommand(f) && f.path_ops == 0 && f.has_node_part &&
                f.coordinates > 0;
       }},
      {StatementKind::kComponentOnPath, "one to[...] naming a component",
       [](const Features &f) {
         return IsPathCommand(f) && f.path_ops == 1 &&
                f.first_to_names_component;
       }},
      {StatementKind::kSimpleWire, "one path operator",
       [](const Features &f) {
         return IsPathCommand(f) && f.path_ops == 1 && f.coordinates > 0;
       }},
      {StatementKind::kMultiSegmentPath, "two or more path operators",
       [](const Features &f) {
         return IsPathCommand(f) && f.path_ops >= 2 && f.coordinates > 0;
       }},
  };
  return rules;
}

StatementKind Classify(const std::vector<models::Token> &tokens) {
  auto features = Inspect(tokens);
  for (const auto &rule : Rules()) {
    if (rule.matches(features)) {
      return rule.kind;
    }
  }
  return StatementKind::kUnrecognized;
}

std::string_view Explain(const std::vector<models::Token> &tokens) {
  auto features = Inspect(tokens);
  for (const auto &rule : Rules()) {
    if (rule.matches(features)) {
      return rule.description;
    }
  }
  return "no rule matched";
}

std::optional<std::string> ComponentType(const models::OptionSet &options) {
  for (const auto &[key, value] : options.Entries()) {
    if (lexer::IsKnownComponent(key)) {
      return key;
    }
  }
  return std::nullopt;
}

std::string_view ToString(StatementKind kind) {
  switch (kind) {
  case StatementKind::kStandaloneNode:
    return "StandaloneNode";
  case StatementKind::kSimpleWire:
    return "SimpleWire";
  case StatementKind::kMultiSegmentPath:
    return "MultiSegmentPath";
  case StatementKind::kComponentOnPath:
    return "ComponentOnPath";
  case StatementKind::kGroupOpen:
    return "GroupOpen";
  case StatementKind::kGroupClose:
    return "GroupClose";
  case StatementKind::kUnrecognized:
    return "Unrecognized";
  }
  return "Unrecognized";
}

} // namespace classifier
