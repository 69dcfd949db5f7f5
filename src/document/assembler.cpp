#include "assembler.hpp"

#include "../models/style.hpp"
#include "../utils/utils.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/core.h>
#include <memory>
#include <sstream>
#include <variant>

namespace document {

namespace {
// Editor canvas units per centimetre.
constexpr double kPixelsPerCm = 37.795286;
constexpr double kShapePixelsPerCm = 38.88379;
constexpr double kPi = 3.14159265358979323846;

void ReportStyle(Document &document, std::size_t index,
                 const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    document.Report(document.elements[index].statement_index, 0,
                    DiagnosticKind::kStyle, warning);
  }
}

Json::Value StrokeToJson(const models::Stroke &stroke) {
  Json::Value result(Json::objectValue);
  if (stroke.hidden) {
    result["opacity"] = 0;
    return result;
  }
  if (stroke.width) {
    result["width"] = *stroke.width;
  }
  if (stroke.opacity) {
    result["opacity"] = *stroke.opacity;
  }
  if (stroke.style) {
    result["style"] = *stroke.style;
  }
  if (stroke.color) {
    result["color"] = *stroke.color;
  }
  return result;
}

Json::Value ScaleToJson(const models::Point &scale) {
  Json::Value result(Json::objectValue);
  result["x"] = utils::Round3(scale.x);
  result["y"] = utils::Round3(scale.y);
  return result;
}
} // namespace

std::optional<Units> ParseUnits(std::string_view text) {
  if (text == "cm") {
    return Units::kCentimeters;
  }
  if (text == "px") {
    return Units::kPixels;
  }
  return std::nullopt;
}

std::string_view ToString(Units units) {
  return units == Units::kPixels ? "px" : "cm";
}

Json::Value OptionsToJson(const models::OptionSet &options) {
  Json::Value result(Json::objectValue);
  for (const auto &[key, value] : options.Entries()) {
    switch (value.kind) {
    case models::OptionValue::Kind::kFlag:
      result[key] = true;
      break;
    case models::OptionValue::Kind::kString:
      result[key] = value.text;
      break;
    case models::OptionValue::Kind::kList: {
      Json::Value items(Json::arrayValue);
      for (const auto &item : value.items) {
        items.append(item);
      }
      result[key] = items;
      break;
    }
    }
  }
  return result;
}

Json::Value LabelToJson(const models::Label &label) {
  Json::Value result(Json::objectValue);
  result["value"] = label.value;
  if (label.font_size) {
    result["fontSize"] = *label.font_size;
  }
  if (label.color) {
    result["color"] = *label.color;
  }
  if (label.anchor) {
    result["anchor"] = *label.anchor;
  }
  if (label.distance) {
    result["distance"] = *label.distance;
  }
  if (label.other_side) {
    result["otherSide"] = "true";
  }
  return result;
}

Json::Value ShapeTextToJson(const models::Label &text) {
  Json::Value result(Json::objectValue);
  result["align"] = "1";
  result["justify"] = "0";
  result["innerSep"] = "0";
  result["showPlaceholderText"] = "true";
  result["text"] = text.value;
  if (text.font_size) {
    result["fontSize"] = *text.font_size;
  }
  if (text.color) {
    result["color"] = *text.color;
  }
  return result;
}

std::string ToJsonString(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  builder["precision"] = 3;
  builder["precisionType"] = "decimal";
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  std::ostringstream out;
  writer->write(value, &out);
  return out.str();
}

DocumentAssembler::DocumentAssembler(JsonOptions options) : options_(options) {}

void DocumentAssembler::AssignIds(Document &document) const {
  std::size_t counters[4] = {0, 0, 0, 0};
  for (auto &element : document.elements) {
    auto kind = element.Kind();
    element.id = fmt::format("{}{}", models::ToString(kind),
                             ++counters[static_cast<int>(kind)]);
  }
}

models::Point DocumentAssembler::ToOutput(const models::Point &point) const {
  if (options_.units == Units::kPixels) {
    return {point.x * kPixelsPerCm, -point.y * kPixelsPerCm};
  }
  return point;
}

Bounds DocumentAssembler::ComputeBounds(const Document &document) const {
  Bounds bounds;
  bool any = false;
  for (const auto &element : document.elements) {
    for (const auto *coordinate : element.Coordinates()) {
      if (!coordinate->resolved.has_value()) {
        continue;
      }
      auto point = ToOutput(*coordinate->resolved);
      if (!any) {
        bounds = Bounds{point.x, point.y, point.x, point.y};
        any = true;
        continue;
      }
      bounds.min_x = std::min(bounds.min_x, point.x);
      bounds.min_y = std::min(bounds.min_y, point.y);
      bounds.max_x = std::max(bounds.max_x, point.x);
      bounds.max_y = std::max(bounds.max_y, point.y);
    }
  }
  return bounds;
}

Json::Value DocumentAssembler::PointToJson(const models::Point &point) const {
  auto output = ToOutput(point);
  Json::Value result(Json::objectValue);
  result["x"] = utils::Round3(output.x);
  result["y"] = utils::Round3(output.y);
  return result;
}

Json::Value
DocumentAssembler::PathPointToJson(const models::PathPoint &point) const {
  auto result = PointToJson(point.coordinate.resolved.value_or(models::Point{}));
  if (point.label.has_value()) {
    result["label"] = LabelToJson(*point.label);
  }
  return result;
}

Json::Value DocumentAssembler::NodeToJson(Document &document,
                                          std::size_t index) const {
  const auto &node = std::get<models::Node>(document.elements[index].body);
  Json::Value result(Json::objectValue);
  if (node.name) {
    result["name"] = *node.name;
  }
  result["position"] =
      PointToJson(node.position.resolved.value_or(models::Point{}));
  if (node.is_shape) {
    result["shape"] = node.shape == "rectangle" ? "rect" : "ellipse";
  } else if (!node.shape.empty()) {
    result["shape"] = node.shape;
  }
  if (!node.options.Empty()) {
    result["options"] = OptionsToJson(node.options);
  }
  if (node.label) {
    auto label = LabelToJson(*node.label);
    if (node.is_shape) {
      // The editor places a shape's label itself, outside the top right.
      label["position"] = "northeast";
      label["relativeToComponent"] = "true";
    } else {
      if (!label.isMember("anchor")) {
        label["anchor"] = "default";
      }
      label["position"] = "default";
    }
    result["label"] = label;
  }
  if (node.text) {
    result["text"] = ShapeTextToJson(*node.text);
  }

  if (node.is_shape) {
    std::vector<std::string> warnings;
    result["stroke"] = StrokeToJson(models::ParseStroke(node.options, false,
                                                        warnings));
    ReportStyle(document, index, warnings);
    if (auto fill = models::ParseFill(node.options)) {
      Json::Value fill_json(Json::objectValue);
      if (fill->color) {
        fill_json["color"] = *fill->color;
      }
      if (fill->opacity) {
        fill_json["opacity"] = *fill->opacity;
      }
      result["fill"] = fill_json;
    }
    if (auto size = models::ParseShapeSize(node.options)) {
      double factor =
          options_.units == Units::kPixels ? kShapePixelsPerCm : 1.0;
      Json::Value size_json(Json::objectValue);
      size_json["x"] = utils::Round3(size->x * factor);
      size_json["y"] = utils::Round3(size->y * factor);
      result["size"] = size_json;
    }
  }

  auto transform = models::ParseTransform(node.options);
  if (transform.rotation) {
    result["rotation"] = utils::Round3(*transform.rotation);
  }
  if (transform.scale) {
    result["scale"] = ScaleToJson(*transform.scale);
  }
  return result;
}

Json::Value DocumentAssembler::WireToJson(Document &document,
                                          std::size_t index) const {
  const auto &wire = std::get<models::Wire>(document.elements[index].body);
  Json::Value result(Json::objectValue);
  Json::Value points(Json::arrayValue);
  for (const auto &point : wire.points) {
    points.append(PathPointToJson(point));
  }
  result["points"] = points;
  Json::Value directions(Json::arrayValue);
  for (const auto &direction : wire.directions) {
    directions.append(direction);
  }
  result["directions"] = directions;
  if (!wire.options.Empty()) {
    result["options"] = OptionsToJson(wire.options);
  }

  std::vector<std::string> warnings;
  auto stroke = StrokeToJson(models::ParseStroke(wire.options, wire.drawn,
                                                 warnings));
  if (!stroke.empty()) {
    result["stroke"] = stroke;
  }
  auto tips = models::ParseArrows(wire.options, warnings);
  if (tips.start) {
    result["startArrow"] = *tips.start;
  }
  if (tips.end) {
    result["endArrow"] = *tips.end;
  }
  ReportStyle(document, index, warnings);
  return result;
}

Json::Value DocumentAssembler::ComponentToJson(Document &document,
                                               std::size_t index) const {
  const auto &component =
      std::get<models::Component>(document.elements[index].body);
  Json::Value result(Json::objectValue);
  result["kind"] = component.type;
  if (component.name) {
    result["name"] = *component.name;
  }
  Json::Value points(Json::arrayValue);
  for (const auto &terminal : component.terminals) {
    points.append(PathPointToJson(terminal));
  }
  result["points"] = points;

  if (auto rotate = component.options.GetNumber("rotate")) {
    result["rotation"] = utils::Round3(*rotate);
  } else {
    auto start = ToOutput(
        component.terminals.front().coordinate.resolved.value_or(models::Point{}));
    auto end = ToOutput(
        component.terminals.back().coordinate.resolved.value_or(models::Point{}));
    double degrees = std::atan2(end.y - start.y, end.x - start.x) * 180.0 / kPi;
    result["rotation"] = utils::Round3(degrees);
  }

  result["options"] = OptionsToJson(component.options);
  if (component.label) {
    result["label"] = LabelToJson(*component.label);
  }
  if (auto scale = models::ParseMirrorInvert(component.options)) {
    result["scale"] = ScaleToJson(*scale);
  }
  auto terminals = models::ParseTerminals(component.options);
  if (terminals.start) {
    result["startNode"] = *terminals.start;
  }
  if (terminals.end) {
    result["endNode"] = *terminals.end;
  }
  return result;
}

Json::Value DocumentAssembler::ElementToJson(
    Document &document, std::size_t index,
    const std::vector<std::vector<std::size_t>> &children) const {
  const auto &element = document.elements[index];
  Json::Value body;
  switch (element.Kind()) {
  case models::ElementKind::kNode:
    body = NodeToJson(document, index);
    break;
  case models::ElementKind::kWire:
    body = WireToJson(document, index);
    break;
  case models::ElementKind::kComponent:
    body = ComponentToJson(document, index);
    break;
  case models::ElementKind::kGroup: {
    const auto &group = std::get<models::Group>(element.body);
    body = Json::Value(Json::objectValue);
    body["name"] = group.name;
    if (!group.options.Empty()) {
      body["options"] = OptionsToJson(group.options);
    }
    Json::Value members(Json::arrayValue);
    for (auto child : children[index]) {
      members.append(ElementToJson(document, child, children));
    }
    body["elements"] = members;
    break;
  }
  }

  Json::Value result(Json::objectValue);
  result["type"] = std::string(models::ToString(element.Kind()));
  result["id"] = document.elements[index].id;
  for (const auto &key : body.getMemberNames()) {
    result[key] = body[key];
  }
  return result;
}

Json::Value DocumentAssembler::Assemble(Document &document) const {
  AssignIds(document);

  std::vector<std::vector<std::size_t>> children(document.elements.size());
  std::vector<std::size_t> roots;
  for (std::size_t i = 0; i < document.elements.size(); i++) {
    const auto &group = document.elements[i].group;
    if (group.has_value() && *group < document.elements.size()) {
      children[*group].push_back(i);
    } else {
      roots.push_back(i);
    }
  }

  Json::Value root(Json::objectValue);
  root["version"] = std::string(kFormatVersion);
  root["units"] = std::string(ToString(options_.units));
  auto bounds = ComputeBounds(document);
  Json::Value bounds_json(Json::objectValue);
  bounds_json["minX"] = utils::Round3(bounds.min_x);
  bounds_json["minY"] = utils::Round3(bounds.min_y);
  bounds_json["maxX"] = utils::Round3(bounds.max_x);
  bounds_json["maxY"] = utils::Round3(bounds.max_y);
  root["bounds"] = bounds_json;

  Json::Value elements(Json::arrayValue);
  for (auto index : roots) {
    elements.append(ElementToJson(document, index, children));
  }
  root["elements"] = elements;
  return root;
}

} // namespace document
