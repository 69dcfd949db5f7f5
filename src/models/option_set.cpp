#include "option_set.hpp"

#include "../utils/utils.hpp"

#include <algorithm>
#include <cstdlib>

namespace models {

namespace {
// First '=' outside braces and math; npos for a flag.
std::size_t FindAssignment(std::string_view part) {
  int depth = 0;
  bool in_math = false;
  for (std::size_t i = 0; i < part.size(); i++) {
    char c = part[i];
    if (c == '\\') {
      i++;
    } else if (c == '$') {
      in_math = !in_math;
    } else if (c == '{' || c == '[' || c == '(') {
      depth++;
    } else if (c == '}' || c == ']' || c == ')') {
      depth--;
    } else if (c == '=' && depth == 0 && !in_math) {
      return i;
    }
  }
  return std::string_view::npos;
}

OptionValue MakeValue(std::string_view raw) {
  OptionValue value;
  std::string trimmed = utils::Trim(raw);
  bool braced = utils::IsWrappedIn(trimmed, '{', '}');
  value.text = utils::StripOuterBraces(trimmed);
  value.kind = OptionValue::Kind::kString;
  if (braced) {
    auto items = utils::SplitTopLevel(value.text, ',');
    if (items.size() > 1) {
      value.kind = OptionValue::Kind::kList;
      value.items = std::move(items);
    }
  }
  return value;
}
} // namespace

OptionSet OptionSet::Parse(std::string_view body) {
  OptionSet result;
  for (const auto &part : utils::SplitTopLevel(body, ',')) {
    if (part.empty()) {
      continue;
    }
    auto assignment = FindAssignment(part);
    if (assignment == std::string_view::npos) {
      result.SetFlag(utils::CollapseSpaces(part));
      continue;
    }
    std::string key =
        utils::CollapseSpaces(std::string_view(part).substr(0, assignment));
    result.Set(key, MakeValue(std::string_view(part).substr(assignment + 1)));
  }
  return result;
}

void OptionSet::Set(const std::string &key, OptionValue value) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&key](const Entry &entry) { return entry.first == key; });
  if (it != entries_.end()) {
    it->second = std::move(value);
    return;
  }
  entries_.emplace_back(key, std::move(value));
}

void OptionSet::SetFlag(const std::string &key) { Set(key, OptionValue{}); }

bool OptionSet::Has(std::string_view key) const { return Find(key) != nullptr; }

const OptionValue *OptionSet::Find(std::string_view key) const {
  for (const auto &entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

std::optional<std::string> OptionSet::GetString(std::string_view key) const {
  const OptionValue *value = Find(key);
  if (value == nullptr || value->kind == OptionValue::Kind::kFlag) {
    return std::nullopt;
  }
  return value->text;
}

std::optional<double> OptionSet::GetNumber(std::string_view key) const {
  auto text = GetString(key);
  if (!text.has_value() || text->empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  double number = std::strtod(text->c_str(), &end);
  if (end == text->c_str() || !utils::Trim(end).empty()) {
    return std::nullopt;
  }
  return number;
}

std::vector<std::string> OptionSet::Flags() const {
  std::vector<std::string> flags;
  for (const auto &entry : entries_) {
    if (entry.second.kind == OptionValue::Kind::kFlag) {
      flags.push_back(entry.first);
    }
  }
  return flags;
}

void OptionSet::Merge(const OptionSet &other) {
  for (const auto &entry : other.entries_) {
    Set(entry.first, entry.second);
  }
}

bool OptionSet::operator==(const OptionSet &other) const {
  if (entries_.size() != other.entries_.size()) {
    return false;
  }
  for (const auto &entry : entries_) {
    const OptionValue *value = other.Find(entry.first);
    if (value == nullptr || !(*value == entry.second)) {
      return false;
    }
  }
  return true;
}

} // namespace models
