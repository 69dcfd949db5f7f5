#include "label.hpp"

#include "../utils/utils.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <fmt/core.h>

namespace models {

namespace {
constexpr std::array<std::string_view, 10> kFontSizes = {
    "tiny",  "scriptsize", "footnotesize", "small", "normalsize",
    "large", "Large",      "LARGE",        "huge",  "Huge"};

bool IsFontSize(std::string_view command) {
  for (auto size : kFontSizes) {
    if (size == command) {
      return true;
    }
  }
  return false;
}

// Length of the balanced `{...}` group starting at `start`, 0 if none.
std::size_t GroupLength(std::string_view text, std::size_t start) {
  if (start >= text.size() || text[start] != '{') {
    return 0;
  }
  int depth = 0;
  for (std::size_t i = start; i < text.size(); i++) {
    if (text[i] == '\\') {
      i++;
    } else if (text[i] == '{') {
      depth++;
    } else if (text[i] == '}' && --depth == 0) {
      return i - start + 1;
    }
  }
  return 0;
}

std::string ReplaceLineBreaks(std::string_view text) {
  std::string result;
  bool in_math = false;
  for (std::size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (c == '\\' && i + 1 < text.size()) {
      if (text[i + 1] == '\\' && !in_math) {
        while (!result.empty() && result.back() == ' ') {
          result.pop_back();
        }
        result += '\n';
        i++;
        while (i + 1 < text.size() && text[i + 1] == ' ') {
          i++;
        }
        continue;
      }
      result += c;
      result += text[++i];
      continue;
    }
    if (c == '$') {
      in_math = !in_math;
    }
    result += c;
  }
  return result;
}
} // namespace

std::string NormalizeLabelText(std::string_view raw) {
  return utils::Trim(ReplaceLineBreaks(raw));
}

std::string ConvertColor(std::string_view color) {
  std::string trimmed = utils::CollapseSpaces(color);
  std::string compact;
  for (char c : trimmed) {
    if (c != ' ') {
      compact += c;
    }
  }
  unsigned red = 0, green = 0, blue = 0;
  if (std::sscanf(compact.c_str(), "rgb,255:red,%u;green,%u;blue,%u", &red,
                  &green, &blue) == 3) {
    return fmt::format("rgb({},{},{})", red, green, blue);
  }
  return trimmed;
}

Label MakeLabel(std::string_view raw) {
  Label label;
  std::string text = utils::Trim(raw);

  constexpr std::string_view kTextColor = "\\textcolor";
  if (text.compare(0, kTextColor.size(), kTextColor) == 0) {
    std::size_t color_start = kTextColor.size();
    std::size_t color_length = GroupLength(text, color_start);
    std::size_t body_start = color_start + color_length;
    std::size_t body_length = GroupLength(text, body_start);
    if (color_length > 0 && body_length > 0 &&
        body_start + body_length == text.size()) {
      label.color = ConvertColor(
          std::string_view(text).substr(color_start + 1, color_length - 2));
      text = text.substr(body_start + 1, body_length - 2);
    }
  }

  text = utils::Trim(text);
  // `{\small ...}` scopes the size to the group, which is the whole label.
  std::string_view sized = text;
  if (GroupLength(text, 0) == text.size() && text.size() > 2) {
    sized = std::string_view(text).substr(1, text.size() - 2);
  }
  if (!sized.empty() && sized[0] == '\\') {
    std::size_t end = 1;
    while (end < sized.size() &&
           std::isalpha(static_cast<unsigned char>(sized[end]))) {
      end++;
    }
    std::string command(sized.substr(1, end - 1));
    if (IsFontSize(command)) {
      label.font_size = command;
      text = std::string(sized.substr(end));
    }
  }

  label.value = NormalizeLabelText(text);
  return label;
}

} // namespace models
