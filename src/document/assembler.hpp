#pragma once

#include "document.hpp"

#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>

namespace document {

enum class Units { kCentimeters, kPixels };

/**
 * @brief Parses `cm` or `px`.
 */
std::optional<Units> ParseUnits(std::string_view text);
std::string_view ToString(Units units);

/**
 * @struct JsonOptions
 * How coordinates are written.
 */
struct JsonOptions {
  Units units = Units::kCentimeters;
};

/**
 * @struct Bounds
 * Bounding box of every resolved coordinate, in output units.
 */
struct Bounds {
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;
};

constexpr std::string_view kFormatVersion = "0.1";

/**
 * @class DocumentAssembler
 * @brief Produces the JSON object graph of a built document.
 *
 * Elements keep their submission order. Members of a group are written in
 * the group's `elements` array instead of the top-level list.
 */
class DocumentAssembler {
public:
  explicit DocumentAssembler(JsonOptions options = JsonOptions{});

  /**
   * @brief Numbers elements per kind in document order: `node1`, `wire1`,
   * `component1`, `group1`, ...
   */
  void AssignIds(Document &document) const;

  /**
   * @brief Bounding box of all resolved coordinates, all zero when there
   * are none.
   */
  Bounds ComputeBounds(const Document &document) const;

  /**
   * @brief Assigns ids and builds the root object.
   *
   * Style options that cannot be expressed in the output are reported as
   * Style diagnostics on the document.
   */
  Json::Value Assemble(Document &document) const;

private:
  Json::Value ElementToJson(Document &document, std::size_t index,
                            const std::vector<std::vector<std::size_t>>
                                &children) const;
  Json::Value NodeToJson(Document &document, std::size_t index) const;
  Json::Value WireToJson(Document &document, std::size_t index) const;
  Json::Value ComponentToJson(Document &document, std::size_t index) const;

  Json::Value PointToJson(const models::Point &point) const;
  Json::Value PathPointToJson(const models::PathPoint &point) const;
  models::Point ToOutput(const models::Point &point) const;

  JsonOptions options_;
};

/**
 * @brief Option set as a JSON object: flags become `true`, braced lists
 * become arrays.
 */
Json::Value OptionsToJson(const models::OptionSet &options);

Json::Value LabelToJson(const models::Label &label);

/**
 * @brief Text drawn inside a shape, with the editor's default text box
 * settings.
 */
Json::Value ShapeTextToJson(const models::Label &text);

/**
 * @brief Serializes with two-space indentation, UTF-8 kept as is.
 */
std::string ToJsonString(const Json::Value &value);

} // namespace document
