#pragma once

#include "models_fwd.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace models {

/**
 * @struct OptionValue
 * Value of one `key=value` entry of an option block.
 */
struct OptionValue {
  enum class Kind { kFlag, kString, kList };

  Kind kind = Kind::kFlag;        /**< Flag, plain value or braced list. */
  std::string text;               /**< Value text, outer braces removed. */
  std::vector<std::string> items; /**< Parts of a braced comma list. */

  bool operator==(const OptionValue &other) const {
    return kind == other.kind && text == other.text && items == other.items;
  }
};

/**
 * @class OptionSet
 * @brief Key to value mapping parsed from a `[...]` block.
 *
 * Keys are case-sensitive and whitespace-normalized. Setting an existing key
 * replaces its value (last write wins) but keeps the key at the position of
 * its first appearance, which is what the component type lookup relies on.
 */
class OptionSet {
public:
  using Entry = std::pair<std::string, OptionValue>;

  /**
   * @brief Parses the inside of an option block.
   * @param body The block text without the enclosing brackets.
   * @return The parsed set; empty entries (`a,,b`) are skipped.
   */
  static OptionSet Parse(std::string_view body);

  void Set(const std::string &key, OptionValue value);
  void SetFlag(const std::string &key);

  bool Has(std::string_view key) const;
  bool Empty() const { return entries_.empty(); }
  std::size_t Size() const { return entries_.size(); }

  /**
   * @brief Finds the value stored for a key.
   * @return Pointer into the set, or nullptr when the key is absent.
   */
  const OptionValue *Find(std::string_view key) const;

  /**
   * @brief Value text of a key, flags excluded.
   */
  std::optional<std::string> GetString(std::string_view key) const;

  /**
   * @brief Value of a key read as a plain number (`rotate=-45`).
   */
  std::optional<double> GetNumber(std::string_view key) const;

  /**
   * @brief Keys of all flag entries in source order.
   */
  std::vector<std::string> Flags() const;

  /**
   * @brief Copies every entry of `other` into this set, `other` winning.
   */
  void Merge(const OptionSet &other);

  const std::vector<Entry> &Entries() const { return entries_; }

  /**
   * @brief Set equality, independent of insertion order.
   */
  bool operator==(const OptionSet &other) const;
  bool operator!=(const OptionSet &other) const { return !(*this == other); }

private:
  std::vector<Entry> entries_;
};

} // namespace models
