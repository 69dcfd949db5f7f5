#include "deferred.hpp"

#include "build_error.hpp"
#include <fmt/core.h>
#include <optional>
#include <variant>

namespace builder {

namespace {
models::Point Midpoint(const models::Point &a, const models::Point &b) {
  return {(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}
} // namespace

DeferredResolver::DeferredResolver(document::Document &document,
                                   NameTable &names)
    : document_(document), names_(names),
      states_(document.elements.size(), State::kPending) {}

std::size_t DeferredResolver::ResolveAll() {
  for (std::size_t i = 0; i < document_.elements.size(); i++) {
    Resolve(i);
  }
  return Drop();
}

bool DeferredResolver::Resolve(std::size_t index) {
  switch (states_[index]) {
  case State::kDone:
    return true;
  case State::kFailed:
    return false;
  default:
    break;
  }
  states_[index] = State::kInProgress;
  try {
    ResolvePoints(index);
  } catch (const UnresolvedReferenceError &error) {
    states_[index] = State::kFailed;
    document_.Report(document_.elements[index].statement_index,
                     error.GetOffset(),
                     document::DiagnosticKind::kUnresolvedReference,
                     fmt::format("{} dropped: {}",
                                 models::ToString(
                                     document_.elements[index].Kind()),
                                 error.what()));
    return false;
  }
  states_[index] = State::kDone;
  return true;
}

void DeferredResolver::ResolvePoints(std::size_t index) {
  for (auto *coordinate : document_.elements[index].Coordinates()) {
    switch (coordinate->kind) {
    case models::CoordinateKind::kAbsolute:
      coordinate->resolved = coordinate->value + coordinate->shift;
      break;
    case models::CoordinateKind::kNamed:
      coordinate->resolved = Locate(*coordinate, index) + coordinate->shift;
      break;
    case models::CoordinateKind::kRelative:
      if (coordinate->name.empty()) {
        throw UnresolvedReferenceError(
            coordinate->offset, "",
            "relative coordinate without a current point");
      }
      coordinate->resolved =
          Locate(*coordinate, index) + coordinate->value + coordinate->shift;
      break;
    }
  }
}

models::Point DeferredResolver::Locate(const models::Coordinate &coordinate,
                                       std::size_t referrer) {
  const auto &name = coordinate.name;
  const auto &from = document_.elements[referrer];
  auto target = names_.Lookup(name, from.visible_scopes, from.statement_index);
  if (!target.has_value()) {
    throw UnresolvedReferenceError(
        coordinate.offset, name,
        fmt::format("name '{}' is not defined in any visible scope", name));
  }

  auto &element = document_.elements[target->element];
  if (target->point.has_value()) {
    auto points = element.Coordinates();
    // A path may refer back to one of its own earlier points.
    if (*target->point < points.size() &&
        points[*target->point]->resolved.has_value()) {
      return *points[*target->point]->resolved;
    }
  }

  if (states_[target->element] == State::kInProgress) {
    throw UnresolvedReferenceError(
        coordinate.offset, name,
        fmt::format("circular reference through '{}'", name));
  }
  if (!Resolve(target->element)) {
    throw UnresolvedReferenceError(
        coordinate.offset, name,
        fmt::format("name '{}' refers to a dropped element", name));
  }

  auto points = element.Coordinates();
  if (target->point.has_value()) {
    return *points.at(*target->point)->resolved;
  }
  if (auto *component = std::get_if<models::Component>(&element.body)) {
    const auto &start = *component->terminals.front().coordinate.resolved;
    const auto &end = *component->terminals.back().coordinate.resolved;
    if (coordinate.anchor == "start" || coordinate.anchor == "-") {
      return start;
    }
    if (coordinate.anchor == "end" || coordinate.anchor == "+") {
      return end;
    }
    return Midpoint(start, end);
  }
  if (points.empty()) {
    throw UnresolvedReferenceError(
        coordinate.offset, name,
        fmt::format("name '{}' does not denote a point", name));
  }
  return *points.front()->resolved;
}

std::size_t DeferredResolver::Drop() {
  auto &elements = document_.elements;
  std::vector<std::optional<std::size_t>> remap(elements.size());
  std::vector<models::Element> kept;
  kept.reserve(elements.size());
  for (std::size_t i = 0; i < elements.size(); i++) {
    if (states_[i] == State::kFailed) {
      continue;
    }
    remap[i] = kept.size();
    kept.push_back(std::move(elements[i]));
  }
  for (auto &element : kept) {
    if (element.group.has_value()) {
      element.group = remap[*element.group];
    }
  }
  std::size_t dropped = elements.size() - kept.size();
  elements = std::move(kept);
  names_.Remap(remap);
  states_.assign(elements.size(), State::kDone);
  return dropped;
}

} // namespace builder
