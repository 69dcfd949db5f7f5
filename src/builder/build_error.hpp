#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace builder {
/**
 * @brief Raised for a construct the builder does not support inside an
 * otherwise recognised statement.
 */
class BuildError : public std::runtime_error {
public:
  BuildError(std::size_t offset, const std::string &reason)
      : std::runtime_error(reason), offset_(offset) {}

  std::size_t GetOffset() const { return offset_; }

private:
  std::size_t offset_;
};

/**
 * @brief Raised when a named coordinate cannot be resolved in any visible
 * scope.
 */
class UnresolvedReferenceError : public std::runtime_error {
public:
  UnresolvedReferenceError(std::size_t offset, const std::string &name,
                           const std::string &reason)
      : std::runtime_error(reason), offset_(offset), name_(name) {}

  std::size_t GetOffset() const { return offset_; }
  const std::string &GetName() const { return name_; }

private:
  std::size_t offset_;
  std::string name_;
};
} // namespace builder
