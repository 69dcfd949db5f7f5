#include "builder.hpp"

#include "../lexer/names.hpp"
#include "../models/coordinate.hpp"
#include "../models/label.hpp"
#include "../models/option_set.hpp"
#include "build_error.hpp"
#include "deferred.hpp"
#include <fmt/core.h>
#include <unordered_set>

namespace builder {

namespace {
using models::Token;
using models::TokenKind;

// Flags that style a node rather than name what it is.
const std::unordered_set<std::string_view> kNodeStyleFlags{
    "draw",          "fill",         "thick",          "thin",
    "very thick",    "ultra thick",  "semithick",      "very thin",
    "dashed",        "dotted",       "densely dotted", "loosely dotted",
    "densely dashed", "loosely dashed", "transform shape", "right",
    "left",          "above",        "below",          "above right",
    "above left",    "below right",  "below left",     "midway",
    "pos",           "sloped",       "inner sep",      "outer sep"};

const std::unordered_set<std::string_view> kOutlineShapes{"circle", "rectangle",
                                                          "ellipse"};

constexpr std::string_view kDeviceLabelDistance = "0.12cm";
constexpr std::string_view kShapeLabelDistance = "0.16cm";

class TokenCursor {
public:
  explicit TokenCursor(const std::vector<Token> &tokens, std::size_t pos = 0)
      : tokens_(tokens), pos_(pos) {}

  bool AtEnd() const {
    return pos_ >= tokens_.size() ||
           tokens_[pos_].kind == TokenKind::kDelimiter;
  }

  const Token *Peek() const { return AtEnd() ? nullptr : &tokens_[pos_]; }

  const Token *Accept(TokenKind kind) {
    if (AtEnd() || tokens_[pos_].kind != kind) {
      return nullptr;
    }
    return &tokens_[pos_++];
  }

  const Token *Accept(TokenKind kind, std::string_view lexeme) {
    if (AtEnd() || !tokens_[pos_].Is(kind, lexeme)) {
      return nullptr;
    }
    return &tokens_[pos_++];
  }

  const Token &Expect(TokenKind kind, std::string_view what) {
    if (auto *token = Accept(kind)) {
      return *token;
    }
    throw BuildError(Offset(), fmt::format("expected {}", what));
  }

  std::size_t Offset() const {
    if (pos_ < tokens_.size()) {
      return tokens_[pos_].offset;
    }
    return tokens_.empty() ? 0 : tokens_.back().offset;
  }

  void ExpectEnd() {
    if (auto *token = Peek()) {
      throw BuildError(token->offset,
                       fmt::format("unexpected '{}'", token->lexeme));
    }
  }

private:
  const std::vector<Token> &tokens_;
  std::size_t pos_;
};

/**
 * @struct NodePart
 * One `node[...] (name) at (...) {...}` part; the `node` keyword itself is
 * already consumed.
 */
struct NodePart {
  models::OptionSet options;
  std::optional<std::string> name;
  std::optional<Token> at; /**< Only the main part's position is used. */
  std::optional<std::string> text;
};

models::Coordinate ToCoordinate(const Token &token) {
  auto coordinate = models::ParseCoordinate(token);
  if (!coordinate.has_value()) {
    throw BuildError(token.offset,
                     fmt::format("unsupported coordinate '{}'", token.lexeme));
  }
  return *coordinate;
}

NodePart ParseNodePart(TokenCursor &cursor) {
  NodePart part;
  while (auto *token = cursor.Peek()) {
    if (token->kind == TokenKind::kOptionBlock) {
      part.options.Merge(models::OptionSet::Parse(token->Body()));
      cursor.Accept(TokenKind::kOptionBlock);
    } else if (token->kind == TokenKind::kCoordinate && !part.name &&
               !part.at) {
      auto name = models::ParseNameDeclaration(*token);
      if (!name.has_value()) {
        throw BuildError(token->offset,
                         fmt::format("expected a node name, got '{}'",
                                     token->lexeme));
      }
      part.name = *name;
      cursor.Accept(TokenKind::kCoordinate);
    } else if (token->Is(TokenKind::kKeyword, lexer::kAtKeyword)) {
      cursor.Accept(TokenKind::kKeyword);
      part.at =
          cursor.Expect(TokenKind::kCoordinate, "a coordinate after 'at'");
    } else if (token->kind == TokenKind::kText) {
      part.text = token->Body();
      cursor.Accept(TokenKind::kText);
      break;
    } else {
      break;
    }
  }
  if (!part.name.has_value()) {
    part.name = part.options.GetString("name");
  }
  return part;
}

bool HasText(const NodePart &part) {
  return part.text.has_value() && !models::NormalizeLabelText(*part.text).empty();
}

std::string NodeShape(const models::OptionSet &options, bool &is_shape) {
  if (auto shape = options.GetString("shape")) {
    is_shape = true;
    return *shape;
  }
  for (const auto &flag : options.Flags()) {
    if (kNodeStyleFlags.count(flag) > 0 || flag.find('-') != std::string::npos) {
      continue;
    }
    is_shape = kOutlineShapes.count(flag) > 0;
    return flag;
  }
  is_shape = false;
  return "";
}

models::Label ChainedLabel(const NodePart &part, std::string_view distance) {
  auto label = models::MakeLabel(*part.text);
  label.anchor = part.options.GetString("anchor");
  label.distance = std::string(distance);
  return label;
}

models::Node MakeNode(const NodePart &main, const std::vector<NodePart> &chained,
                      models::Coordinate position, bool is_coordinate) {
  models::Node node;
  node.position = std::move(position);
  node.options = main.options;
  node.name = main.name;
  node.is_coordinate = is_coordinate;
  if (is_coordinate) {
    node.shape = "coordinate";
    return node;
  }
  node.shape = NodeShape(node.options, node.is_shape);

  std::vector<const NodePart *> texts;
  for (const auto &part : chained) {
    if (HasText(part)) {
      texts.push_back(&part);
    }
  }

  if (node.is_shape) {
    if (HasText(main)) {
      node.text = models::MakeLabel(*main.text);
    }
    if (texts.size() == 1) {
      node.text = models::MakeLabel(*texts.front()->text);
    } else if (texts.size() >= 2) {
      node.label = ChainedLabel(*texts.front(), kShapeLabelDistance);
      node.text = models::MakeLabel(*texts.back()->text);
    }
    return node;
  }

  if (HasText(main)) {
    node.label = models::MakeLabel(*main.text);
  }
  for (const auto *part : texts) {
    auto label = ChainedLabel(*part, kDeviceLabelDistance);
    if (!node.label.has_value()) {
      node.label = std::move(label);
    } else {
      node.label->value += " " + label.value;
    }
  }
  return node;
}

// Rebases a relative coordinate on the current point of the statement so
// that it can be resolved on its own later.
models::Coordinate Fold(const models::Coordinate &current,
                        models::Coordinate relative) {
  models::Point offset = relative.value + relative.shift;
  relative.shift = models::Point{};
  switch (current.kind) {
  case models::CoordinateKind::kAbsolute:
    relative.kind = models::CoordinateKind::kAbsolute;
    relative.value = current.value + current.shift + offset;
    break;
  case models::CoordinateKind::kNamed:
    relative.kind = models::CoordinateKind::kRelative;
    relative.name = current.name;
    relative.anchor = current.anchor;
    relative.value = current.shift + offset;
    break;
  case models::CoordinateKind::kRelative:
    relative.name = current.name;
    relative.anchor = current.anchor;
    relative.value = current.value + offset;
    break;
  }
  return relative;
}

struct Segment {
  std::size_t from;
  std::size_t to;
  std::string op;
  std::optional<models::OptionSet> to_options;
};

struct Walk {
  models::OptionSet options;
  std::vector<models::PathPoint> points;
  std::vector<Segment> segments;
  std::vector<std::pair<std::string, std::size_t>> names; /**< Point names. */
};

std::optional<models::Label> ComponentLabel(const models::OptionSet &options,
                                            const std::string &type) {
  std::optional<models::Label> label;
  for (const auto &[key, value] : options.Entries()) {
    if (value.kind == models::OptionValue::Kind::kFlag) {
      continue;
    }
    bool other_side = key == "l_";
    if (key == "l" || key == "l^" || other_side || key == type) {
      label = models::MakeLabel(value.text);
      label->other_side = other_side;
      label->distance = std::string(kDeviceLabelDistance);
    }
  }
  return label;
}

Walk WalkPath(const std::vector<Token> &tokens) {
  Walk walk;
  TokenCursor cursor(tokens, 1);
  if (auto *options = cursor.Accept(TokenKind::kOptionBlock)) {
    walk.options = models::OptionSet::Parse(options->Body());
  }

  std::optional<Segment> pending;
  std::size_t pending_offset = 0;
  auto add_point = [&](models::PathPoint point, std::size_t offset) {
    walk.points.push_back(std::move(point));
    if (pending.has_value()) {
      pending->from = walk.points.size() - 2;
      pending->to = walk.points.size() - 1;
      walk.segments.push_back(std::move(*pending));
      pending.reset();
    } else if (walk.points.size() > 1) {
      throw BuildError(offset, "coordinates without a path operator");
    }
  };
  auto require_point = [&](const Token &token) {
    if (walk.points.empty()) {
      throw BuildError(token.offset,
                       fmt::format("'{}' before any coordinate", token.lexeme));
    }
  };

  while (auto *token = cursor.Peek()) {
    if (token->kind == TokenKind::kCoordinate) {
      cursor.Accept(TokenKind::kCoordinate);
      auto coordinate = ToCoordinate(*token);
      if (coordinate.kind == models::CoordinateKind::kRelative) {
        if (walk.points.empty()) {
          throw BuildError(token->offset,
                           "relative coordinate without a current point");
        }
        coordinate = Fold(walk.points.back().coordinate, coordinate);
      }
      add_point(models::PathPoint{coordinate, std::nullopt}, token->offset);
    } else if (token->kind == TokenKind::kPathOp) {
      cursor.Accept(TokenKind::kPathOp);
      require_point(*token);
      if (pending.has_value()) {
        throw BuildError(token->offset, "two path operators in a row");
      }
      pending = Segment{0, 0, token->lexeme, std::nullopt};
      pending_offset = token->offset;
      if (token->lexeme == lexer::kToOperator) {
        if (auto *options = cursor.Accept(TokenKind::kOptionBlock)) {
          pending->to_options = models::OptionSet::Parse(options->Body());
        }
      }
    } else if (token->Is(TokenKind::kKeyword, lexer::kCycleKeyword)) {
      cursor.Accept(TokenKind::kKeyword);
      require_point(*token);
      if (!pending.has_value()) {
        throw BuildError(token->offset, "'cycle' without a path operator");
      }
      auto first = walk.points.front();
      first.label.reset();
      add_point(std::move(first), token->offset);
    } else if (token->Is(TokenKind::kKeyword, lexer::kNodeKeyword)) {
      cursor.Accept(TokenKind::kKeyword);
      require_point(*token);
      auto part = ParseNodePart(cursor);
      if (HasText(part)) {
        auto label = models::MakeLabel(*part.text);
        label.anchor = part.options.GetString("anchor");
        walk.points.back().label = std::move(label);
      }
      if (part.name.has_value()) {
        walk.names.emplace_back(*part.name, walk.points.size() - 1);
      }
    } else if (token->Is(TokenKind::kKeyword, lexer::kCoordinateKeyword)) {
      cursor.Accept(TokenKind::kKeyword);
      require_point(*token);
      const auto &declaration =
          cursor.Expect(TokenKind::kCoordinate, "a name after 'coordinate'");
      auto name = models::ParseNameDeclaration(declaration);
      if (!name.has_value()) {
        throw BuildError(declaration.offset,
                         fmt::format("invalid coordinate name '{}'",
                                     declaration.lexeme));
      }
      walk.names.emplace_back(*name, walk.points.size() - 1);
    } else {
      throw BuildError(token->offset,
                       fmt::format("unexpected '{}' in path", token->lexeme));
    }
  }

  if (pending.has_value()) {
    throw BuildError(pending_offset, "path ends with a path operator");
  }
  if (walk.segments.empty()) {
    throw BuildError(cursor.Offset(), "path has no segments");
  }
  return walk;
}
} // namespace

SemanticBuilder::SemanticBuilder(document::Document &document)
    : document_(document), groups_seen_(0), finished_(false) {}

void SemanticBuilder::Build(std::size_t statement_index,
                            classifier::StatementKind kind,
                            const std::vector<models::Token> &tokens) {
  switch (kind) {
  case classifier::StatementKind::kGroupOpen:
    OpenGroup(statement_index, tokens);
    break;
  case classifier::StatementKind::kGroupClose:
    CloseGroup(statement_index, tokens);
    break;
  case classifier::StatementKind::kStandaloneNode:
    Commit(statement_index, BuildNodes(tokens));
    break;
  case classifier::StatementKind::kSimpleWire:
  case classifier::StatementKind::kMultiSegmentPath:
  case classifier::StatementKind::kComponentOnPath:
    Commit(statement_index, BuildPath(tokens));
    break;
  case classifier::StatementKind::kUnrecognized:
    throw BuildError(tokens.empty() ? 0 : tokens.front().offset,
                     "statement is not recognised");
  }
}

void SemanticBuilder::OpenGroup(std::size_t statement_index,
                                const std::vector<models::Token> &tokens) {
  TokenCursor cursor(tokens, 1);
  models::Group group;
  if (auto *options = cursor.Accept(TokenKind::kOptionBlock)) {
    group.options = models::OptionSet::Parse(options->Body());
  }
  cursor.ExpectEnd();
  group.name = group.options.GetString("name").value_or(
      fmt::format("scope{}", groups_seen_ + 1));

  Pending pending;
  pending.elements.push_back(models::Element{std::move(group)});
  Commit(statement_index, std::move(pending));
  groups_seen_++;
  open_groups_.push_back(document_.elements.size() - 1);
  std::get<models::Group>(document_.elements.back().body).scope =
      scopes_.AddScope();
}

void SemanticBuilder::CloseGroup(std::size_t statement_index,
                                 const std::vector<models::Token> &tokens) {
  TokenCursor cursor(tokens, 1);
  cursor.ExpectEnd();
  if (open_groups_.empty()) {
    document_.Report(statement_index, tokens.front().offset,
                     document::DiagnosticKind::kStructural,
                     "\\end{scope} without a matching \\begin{scope}");
    return;
  }
  std::get<models::Group>(document_.elements[open_groups_.back()].body)
      .closed = true;
  open_groups_.pop_back();
  scopes_.RemoveScope();
}

SemanticBuilder::Pending
SemanticBuilder::BuildNodes(const std::vector<models::Token> &tokens) const {
  auto command = lexer::ParseCommand(tokens.front().lexeme);
  TokenCursor cursor(tokens, 1);

  std::optional<models::Coordinate> path_position;
  bool is_coordinate = command == lexer::Command::kCoordinate;
  if (command == lexer::Command::kDraw || command == lexer::Command::kPath) {
    cursor.Accept(TokenKind::kOptionBlock);
    const auto &token =
        cursor.Expect(TokenKind::kCoordinate, "a coordinate before 'node'");
    path_position = ToCoordinate(token);
    if (!cursor.Accept(TokenKind::kKeyword, lexer::kNodeKeyword)) {
      throw BuildError(cursor.Offset(), "expected 'node'");
    }
  }

  auto main = ParseNodePart(cursor);
  std::vector<NodePart> chained;
  while (cursor.Accept(TokenKind::kKeyword, lexer::kNodeKeyword)) {
    chained.push_back(ParseNodePart(cursor));
  }
  cursor.ExpectEnd();

  models::Coordinate position;
  if (path_position.has_value()) {
    position = *path_position;
  } else if (main.at.has_value()) {
    position = ToCoordinate(*main.at);
  } else {
    position.offset = tokens.front().offset;
  }
  if (position.kind == models::CoordinateKind::kRelative) {
    throw BuildError(position.offset,
                     "relative coordinate without a current point");
  }
  if (is_coordinate && !main.name.has_value()) {
    throw BuildError(tokens.front().offset, "coordinate without a name");
  }

  Pending pending;
  auto node = MakeNode(main, chained, std::move(position), is_coordinate);
  if (node.name.has_value()) {
    pending.names.emplace_back(*node.name, NameTarget{0, std::nullopt});
  }
  pending.elements.push_back(models::Element{std::move(node)});
  return pending;
}

SemanticBuilder::Pending
SemanticBuilder::BuildPath(const std::vector<models::Token> &tokens) const {
  auto walk = WalkPath(tokens);
  bool drawn = lexer::ParseCommand(tokens.front().lexeme) !=
               lexer::Command::kPath;

  Pending pending;
  // First element and point holding each path point.
  std::vector<std::optional<std::pair<std::size_t, std::size_t>>> owners(
      walk.points.size());
  auto own = [&](std::size_t point, std::size_t local) {
    if (!owners[point].has_value()) {
      owners[point] = std::make_pair(pending.elements.size(), local);
    }
  };

  std::optional<models::Wire> run;
  std::size_t run_last = 0;
  auto flush = [&]() {
    if (run.has_value()) {
      pending.elements.push_back(models::Element{std::move(*run)});
      run.reset();
    }
  };

  for (const auto &segment : walk.segments) {
    std::optional<std::string> type;
    if (segment.to_options.has_value()) {
      type = classifier::ComponentType(*segment.to_options);
    }
    if (type.has_value()) {
      flush();
      models::Component component;
      component.type = *type;
      component.options = walk.options;
      component.options.Merge(*segment.to_options);
      component.terminals = {walk.points[segment.from],
                             walk.points[segment.to]};
      component.label = ComponentLabel(component.options, *type);
      component.name = component.options.GetString("name");
      own(segment.from, 0);
      own(segment.to, 1);
      if (component.name.has_value()) {
        pending.names.emplace_back(
            *component.name, NameTarget{pending.elements.size(), std::nullopt});
      }
      pending.elements.push_back(models::Element{std::move(component)});
      continue;
    }

    std::string direction =
        segment.op == lexer::kToOperator ? "--" : segment.op;
    if (!run.has_value() || run_last != segment.from) {
      flush();
      run = models::Wire{};
      run->options = walk.options;
      run->drawn = drawn;
      run->points.push_back(walk.points[segment.from]);
      own(segment.from, 0);
    }
    run->points.push_back(walk.points[segment.to]);
    run->directions.push_back(direction);
    run_last = segment.to;
    own(segment.to, run->points.size() - 1);
  }
  flush();

  for (const auto &[name, point] : walk.names) {
    const auto &owner = owners[point];
    if (owner.has_value()) {
      pending.names.emplace_back(name, NameTarget{owner->first, owner->second});
    }
  }
  return pending;
}

void SemanticBuilder::Commit(std::size_t statement_index, Pending pending) {
  std::size_t base = document_.elements.size();
  std::optional<std::size_t> group;
  if (!open_groups_.empty()) {
    group = open_groups_.back();
  }
  auto visible = scopes_.GetVisibleScopes();
  for (auto &element : pending.elements) {
    element.statement_index = statement_index;
    element.group = group;
    element.visible_scopes = visible;
    document_.elements.push_back(std::move(element));
  }
  for (auto &[name, target] : pending.names) {
    target.element += base;
    target.statement_index = statement_index;
    names_.Declare(scopes_.GetCurrScope(), name, target);
  }
}

void SemanticBuilder::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  for (auto it = open_groups_.rbegin(); it != open_groups_.rend(); ++it) {
    const auto &element = document_.elements[*it];
    document_.Report(
        element.statement_index, 0, document::DiagnosticKind::kStructural,
        fmt::format("\\begin{{scope}} '{}' is never closed",
                    std::get<models::Group>(element.body).name));
  }
  open_groups_.clear();
  scopes_.ForceClose();
  DeferredResolver(document_, names_).ResolveAll();
}

} // namespace builder
