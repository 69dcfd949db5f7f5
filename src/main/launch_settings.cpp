#include "launch_settings.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <stdexcept>

namespace {
constexpr std::string_view kInputPrefix = "input-";
constexpr std::string_view kOutputPrefix = "output-";
} // namespace

void LaunchSettings::SetUnits(const std::string &value) {
  auto parsed = document::ParseUnits(value);
  if (!parsed.has_value()) {
    throw std::runtime_error(
        fmt::format("bad units '{}' on -u, expected cm or px", value));
  }
  units = *parsed;
}

std::string LaunchSettings::OutputFileFor(const std::string &input) const {
  if (output_file.has_value()) {
    return *output_file;
  }
  std::filesystem::path path(input);
  std::string stem = path.stem().string();
  if (stem.compare(0, kInputPrefix.size(), kInputPrefix) == 0) {
    stem = std::string(kOutputPrefix) + stem.substr(kInputPrefix.size());
  }
  return path.replace_filename(stem + ".json").string();
}
