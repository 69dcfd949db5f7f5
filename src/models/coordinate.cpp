#include "coordinate.hpp"

#include "../utils/utils.hpp"
#include "option_set.hpp"
#include "token.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace models {

namespace {
// 1in = 2.54cm = 72.27pt = 72bp
constexpr std::array<std::pair<std::string_view, double>, 5> kUnits = {{
    {"cm", 1.0},
    {"mm", 0.1},
    {"pt", 2.54 / 72.27},
    {"bp", 2.54 / 72.0},
    {"in", 2.54},
}};

bool IsIdentifier(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
          c == ' ' || c == '-' || c == '+' || c == '.' || c == '\'')) {
      return false;
    }
  }
  return std::isalpha(static_cast<unsigned char>(text[0])) || text[0] == '_';
}

std::optional<Point> ParseShift(std::string_view modifiers) {
  Point shift;
  auto options = OptionSet::Parse(modifiers);
  for (const auto &entry : options.Entries()) {
    auto length = ParseLength(entry.second.text);
    if (!length.has_value()) {
      return std::nullopt;
    }
    if (entry.first == "xshift") {
      shift.x = *length;
    } else if (entry.first == "yshift") {
      shift.y = *length;
    } else {
      return std::nullopt;
    }
  }
  return shift;
}
} // namespace

std::optional<double> ParseLength(std::string_view text) {
  std::string trimmed = utils::Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  double number = std::strtod(trimmed.c_str(), &end);
  if (end == trimmed.c_str()) {
    return std::nullopt;
  }
  // Decimal notation only: no hex floats, no nan or inf.
  std::string_view digits(trimmed.c_str(), end - trimmed.c_str());
  if (digits.find_first_not_of("0123456789+-.eE") != std::string_view::npos ||
      !std::isfinite(number)) {
    return std::nullopt;
  }
  std::string unit = utils::Trim(end);
  if (unit.empty()) {
    return number;
  }
  for (const auto &[name, factor] : kUnits) {
    if (unit == name) {
      return number * factor;
    }
  }
  return std::nullopt;
}

std::optional<Coordinate> ParseCoordinate(const Token &token) {
  Coordinate coordinate;
  coordinate.offset = token.offset;

  std::string body = utils::Trim(token.Body());
  if (!body.empty() && body[0] == '[') {
    auto close = body.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    auto shift = ParseShift(std::string_view(body).substr(1, close - 1));
    if (!shift.has_value()) {
      return std::nullopt;
    }
    coordinate.shift = *shift;
    body = utils::Trim(std::string_view(body).substr(close + 1));
  }

  auto parts = utils::SplitTopLevel(body, ',');
  if (parts.size() == 2) {
    auto x = ParseLength(parts[0]);
    auto y = ParseLength(parts[1]);
    if (!x.has_value() || !y.has_value()) {
      return std::nullopt;
    }
    coordinate.kind = token.IsRelative() ? CoordinateKind::kRelative
                                         : CoordinateKind::kAbsolute;
    coordinate.value = Point{*x, *y};
    return coordinate;
  }

  if (parts.size() != 1 || token.IsRelative() || !IsIdentifier(body)) {
    return std::nullopt;
  }
  coordinate.kind = CoordinateKind::kNamed;
  auto dot = body.rfind('.');
  if (dot != std::string::npos && dot > 0 && dot + 1 < body.size()) {
    coordinate.name = utils::Trim(std::string_view(body).substr(0, dot));
    coordinate.anchor = utils::Trim(std::string_view(body).substr(dot + 1));
  } else {
    coordinate.name = body;
  }
  return coordinate;
}

std::optional<std::string> ParseNameDeclaration(const Token &token) {
  if (token.kind != TokenKind::kCoordinate || token.IsRelative()) {
    return std::nullopt;
  }
  std::string body = utils::Trim(token.Body());
  if (!IsIdentifier(body) || body.find('.') != std::string::npos) {
    return std::nullopt;
  }
  return body;
}

} // namespace models
