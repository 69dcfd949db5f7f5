#include "element.hpp"

namespace models {

std::vector<Coordinate *> Element::Coordinates() {
  std::vector<Coordinate *> result;
  if (auto *node = std::get_if<Node>(&body)) {
    result.push_back(&node->position);
  } else if (auto *wire = std::get_if<Wire>(&body)) {
    for (auto &point : wire->points) {
      result.push_back(&point.coordinate);
    }
  } else if (auto *component = std::get_if<Component>(&body)) {
    for (auto &terminal : component->terminals) {
      result.push_back(&terminal.coordinate);
    }
  }
  return result;
}

std::vector<const Coordinate *> Element::Coordinates() const {
  std::vector<const Coordinate *> result;
  for (auto *coordinate : const_cast<Element *>(this)->Coordinates()) {
    result.push_back(coordinate);
  }
  return result;
}

std::string_view ToString(ElementKind kind) {
  switch (kind) {
  case ElementKind::kNode:
    return "node";
  case ElementKind::kWire:
    return "wire";
  case ElementKind::kComponent:
    return "component";
  case ElementKind::kGroup:
    return "group";
  }
  return "unknown";
}

} // namespace models
