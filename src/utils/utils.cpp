#include "utils.hpp"

#include <cctype>
#include <cmath>

namespace utils {

namespace {
bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }
} // namespace

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && IsSpace(s[begin])) {
    begin++;
  }
  while (end > begin && IsSpace(s[end - 1])) {
    end--;
  }
  return std::string(s.substr(begin, end - begin));
}

std::string CollapseSpaces(std::string_view s) {
  std::string result;
  bool pending_space = false;
  for (char c : Trim(s)) {
    if (IsSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      result += ' ';
      pending_space = false;
    }
    result += c;
  }
  return result;
}

std::vector<std::string> SplitTopLevel(std::string_view s, char separator) {
  std::vector<std::string> parts;
  std::string current;
  int depth = 0;
  bool in_math = false;

  for (std::size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      current += c;
      current += s[++i];
      continue;
    }
    if (c == '$') {
      in_math = !in_math;
    } else if (c == '{' || c == '[' || c == '(') {
      depth++;
    } else if ((c == '}' || c == ']' || c == ')') && depth > 0) {
      depth--;
    } else if (c == separator && depth == 0 && !in_math) {
      parts.push_back(Trim(current));
      current.clear();
      continue;
    }
    current += c;
  }
  if (!Trim(current).empty() || !parts.empty()) {
    parts.push_back(Trim(current));
  }
  return parts;
}

bool IsWrappedIn(std::string_view s, char open, char close) {
  if (s.size() < 2 || s.front() != open || s.back() != close) {
    return false;
  }
  int depth = 0;
  for (std::size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\') {
      i++;
      continue;
    }
    if (s[i] == open) {
      depth++;
    } else if (s[i] == close) {
      depth--;
      if (depth == 0 && i + 1 != s.size()) {
        return false;
      }
    }
  }
  return depth == 0;
}

std::string StripOuterBraces(std::string_view s) {
  std::string trimmed = Trim(s);
  if (IsWrappedIn(trimmed, '{', '}')) {
    return Trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
  }
  return trimmed;
}

double Round3(double value) {
  double rounded = std::round(value * 1000.0) / 1000.0;
  if (rounded == 0.0) {
    return 0.0;
  }
  return rounded;
}

} // namespace utils
