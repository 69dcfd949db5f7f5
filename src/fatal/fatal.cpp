#include "fatal.hpp"

#include <fmt/core.h>
#include <iostream>
#include <stdexcept>

namespace loger {
static constexpr std::string_view kProgram = "circuitikz-convert";

static std::string file_name_;
static std::size_t nr_errs_ = 0;

static std::string Prefix() {
  if (file_name_.empty()) {
    return fmt::format("{}:", kProgram);
  }
  return fmt::format("{}: {}:", kProgram, file_name_);
}

void SetFileName(const std::string &file_name) { file_name_ = file_name; }

void warning(const std::string_view &s1, const std::optional<std::string> &s2) {
  std::cout << fmt::format("{} warning: {}{}", Prefix(), s1, s2.value_or(""));
  std::cout << std::endl;
}

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::cout << fmt::format("{} error: {}{}", Prefix(), s1, s2.value_or(""));
  std::cout << std::endl;
  nr_errs_++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  auto message = fmt::format("{} fatal: {}{}", Prefix(), s1, s2.value_or(""));
  std::cerr << message << std::endl;
  nr_errs_++;
  throw FatalError(message);
}

std::size_t GetErrorCount() { return nr_errs_; }

void ResetErrorCount() { nr_errs_ = 0; }
} // namespace loger
