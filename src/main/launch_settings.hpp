#pragma once

#include "../document/assembler.hpp"

#include <optional>
#include <string>
#include <vector>

struct LaunchSettings {
  bool need_to_print_help_and_stop = false;    // -h
  bool need_to_print_version_and_stop = false; // -V
  bool need_strict = false;                    // -s
  document::Units units = document::Units::kPixels; // -u
  std::optional<std::string> output_file;           // -o
  std::vector<std::string> input_files;

  /**
   * @brief Sets the output units from `cm` or `px`.
   * @throws std::runtime_error on any other value.
   */
  void SetUnits(const std::string &value);

  /**
   * @brief Output path for an input file.
   *
   * `-o` wins when given; otherwise `input-X.tex` becomes `output-X.json`
   * and any other `name.tex` becomes `name.json`, next to the input.
   */
  std::string OutputFileFor(const std::string &input) const;
};
