#include "style.hpp"

#include "../utils/utils.hpp"
#include "label.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/core.h>
#include <string>
#include <unordered_map>

namespace models {

namespace {
// Patterns normalized to a line width of 1pt.
const std::unordered_map<std::string_view, std::string_view> kLineAliases{
    {"on 1pt off 4pt", "dotted"},
    {"on 1pt off 2pt", "denselydotted"},
    {"on 1pt off 8pt", "looselydotted"},
    {"on 4pt off 4pt", "dashed"},
    {"on 4pt off 2pt", "denselydashed"},
    {"on 4pt off 8pt", "looselydashed"},
    {"on 4pt off 2pt on 1pt off 2pt", "dashdot"},
    {"on 4pt off 1pt on 1pt off 1pt", "denselydashdot"},
    {"on 4pt off 4pt on 1pt off 4pt", "looselydashdot"},
    {"on 4pt off 2pt on 1pt off 2pt on 1pt off 2pt", "dashdotdot"},
    {"on 4pt off 1pt on 1pt off 1pt on 1pt off 1pt", "denselydashdotdot"},
    {"on 4pt off 4pt on 1pt off 4pt on 1pt off 4pt", "looselydashdotdot"},
};

// TikZ style flags that map straight onto a named dash style.
const std::unordered_map<std::string_view, std::string_view> kStyleFlags{
    {"dotted", "dotted"},
    {"densely dotted", "denselydotted"},
    {"loosely dotted", "looselydotted"},
    {"dashed", "dashed"},
    {"densely dashed", "denselydashed"},
    {"loosely dashed", "looselydashed"},
    {"dash dot", "dashdot"},
    {"densely dash dot", "denselydashdot"},
    {"loosely dash dot", "looselydashdot"},
};

const std::unordered_map<std::string_view, std::string_view> kArrowAliases{
    {"stealth", "stealth"},
    {"stealth reversed", "stealthR"},
    {"latex", "latex"},
    {"latex reversed", "latexR"},
    {"to", "to"},
    {"to reversed", "toR"},
    {">", "to"},
    {"<", "to"},
    {"|", "line"},
};

const std::unordered_map<std::string_view, std::string_view> kTerminalAliases{
    {"*", "circ"},
    {"o", "ocirc"},
};

double WidthInPoints(const std::string &width) {
  double value = std::strtod(width.c_str(), nullptr);
  return value > 0.0 ? value : 1.0;
}

// Splits a `start-end` flag; std::nullopt when it has no usable dash.
std::optional<std::pair<std::string, std::string>>
SplitTips(const std::string &flag) {
  auto dash = flag.find('-');
  if (dash == std::string::npos || flag.find('-', dash + 1) != std::string::npos) {
    return std::nullopt;
  }
  auto start = utils::Trim(std::string_view(flag).substr(0, dash));
  auto end = utils::Trim(std::string_view(flag).substr(dash + 1));
  if (start.empty() && end.empty()) {
    return std::nullopt;
  }
  return std::make_pair(start, end);
}
} // namespace

std::string NormalizeDashPattern(std::string_view pattern, double line_width) {
  std::string result;
  std::string text = utils::CollapseSpaces(pattern);
  std::size_t i = 0;
  while (i < text.size()) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.') {
      char *end = nullptr;
      double number = std::strtod(text.c_str() + i, &end);
      std::size_t consumed = end - (text.c_str() + i);
      if (text.compare(i + consumed, 2, "pt") == 0) {
        result += fmt::format("{}pt", std::lround(number / line_width));
        i += consumed + 2;
        continue;
      }
      result += text.substr(i, consumed);
      i += consumed;
      continue;
    }
    result += text[i++];
  }
  return result;
}

Stroke ParseStroke(const OptionSet &options, bool drawn_by_default,
                   std::vector<std::string> &warnings) {
  Stroke stroke;
  if (!drawn_by_default && !options.Has("draw")) {
    stroke.hidden = true;
    return stroke;
  }

  double width_for_style = 1.0;
  if (auto width = options.GetString("line width")) {
    stroke.width = *width;
    width_for_style = WidthInPoints(*width);
  }
  if (auto opacity = options.GetString("draw opacity")) {
    stroke.opacity = *opacity;
  }

  if (auto pattern = options.GetString("dash pattern")) {
    auto key = NormalizeDashPattern(*pattern, width_for_style);
    auto alias = kLineAliases.find(key);
    if (alias != kLineAliases.end()) {
      stroke.style = std::string(alias->second);
    } else {
      warnings.push_back(fmt::format(
          "dash pattern '{}' was not converted, using a solid line", key));
    }
  } else {
    for (const auto &flag : options.Flags()) {
      auto alias = kStyleFlags.find(flag);
      if (alias != kStyleFlags.end()) {
        stroke.style = std::string(alias->second);
      }
    }
  }

  if (auto color = options.GetString("draw")) {
    stroke.color = ConvertColor(*color);
  } else if (auto color = options.GetString("color")) {
    stroke.color = ConvertColor(*color);
  }
  return stroke;
}

std::optional<Fill> ParseFill(const OptionSet &options) {
  if (!options.Has("fill") && !options.Has("fill opacity")) {
    return std::nullopt;
  }
  Fill fill;
  if (auto color = options.GetString("fill")) {
    fill.color = ConvertColor(*color);
  }
  if (auto opacity = options.GetString("fill opacity")) {
    fill.opacity = *opacity;
  }
  return fill;
}

Transform ParseTransform(const OptionSet &options) {
  Transform transform;
  auto x = options.GetNumber("xscale");
  auto y = options.GetNumber("yscale");
  auto rotation = options.GetNumber("rotate");

  if (x && y && rotation) {
    transform.scale = Point{*x, *y};
    transform.rotation = *rotation;
  } else if (x && !y && !rotation) {
    transform.scale = Point{-*x, -*x};
    transform.rotation = -180.0;
  } else if (!x && y && !rotation) {
    transform.scale = Point{-*y, *y};
  } else if (rotation) {
    transform.rotation = *rotation;
  } else if (x && y) {
    transform.scale = Point{*x, *y};
  }
  return transform;
}

std::optional<Point> ParseMirrorInvert(const OptionSet &options) {
  bool mirror = options.Has("mirror");
  bool invert = options.Has("invert");
  if (!mirror && !invert) {
    return std::nullopt;
  }
  return Point{mirror ? -1.0 : 1.0, invert ? -1.0 : 1.0};
}

Tips ParseArrows(const OptionSet &options, std::vector<std::string> &warnings) {
  Tips tips;
  for (const auto &flag : options.Flags()) {
    auto parts = SplitTips(flag);
    if (!parts.has_value()) {
      continue;
    }
    bool start_known = parts->first.empty() || kArrowAliases.count(parts->first);
    bool end_known = parts->second.empty() || kArrowAliases.count(parts->second);
    bool start_terminal = kTerminalAliases.count(parts->first) > 0;
    bool end_terminal = kTerminalAliases.count(parts->second) > 0;
    if (start_terminal || end_terminal) {
      continue;
    }
    if (!parts->first.empty()) {
      if (start_known) {
        tips.start = std::string(kArrowAliases.at(parts->first));
      } else {
        warnings.push_back(
            fmt::format("start arrow '{}' is not supported", parts->first));
      }
    }
    if (!parts->second.empty()) {
      if (end_known) {
        tips.end = std::string(kArrowAliases.at(parts->second));
      } else {
        warnings.push_back(
            fmt::format("end arrow '{}' is not supported", parts->second));
      }
    }
  }
  return tips;
}

Tips ParseTerminals(const OptionSet &options) {
  Tips tips;
  for (const auto &flag : options.Flags()) {
    auto parts = SplitTips(flag);
    if (!parts.has_value()) {
      continue;
    }
    auto start = kTerminalAliases.find(parts->first);
    auto end = kTerminalAliases.find(parts->second);
    bool start_ok = parts->first.empty() || start != kTerminalAliases.end();
    bool end_ok = parts->second.empty() || end != kTerminalAliases.end();
    if (!start_ok || !end_ok) {
      continue;
    }
    if (start != kTerminalAliases.end()) {
      tips.start = std::string(start->second);
    }
    if (end != kTerminalAliases.end()) {
      tips.end = std::string(end->second);
    }
  }
  return tips;
}

std::optional<Point> ParseShapeSize(const OptionSet &options) {
  auto width_text = options.GetString("minimum width");
  if (!width_text.has_value()) {
    return std::nullopt;
  }
  auto width = ParseLength(*width_text);
  if (!width.has_value()) {
    return std::nullopt;
  }
  double x = std::max(0.0, *width);
  double y = x;
  if (auto height_text = options.GetString("minimum height")) {
    if (auto height = ParseLength(*height_text)) {
      y = *height;
    }
  }
  return Point{x, y};
}

} // namespace models
