#pragma once

#include "launch_settings.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Class representing the main processor of the program.
 */
class MainProcessor {
public:
  static constexpr int kExitOk = 0;
  static constexpr int kExitError = 1;
  static constexpr int kExitDiagnostics = 2;

  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Converts one `.tex` file and writes its JSON document.
   * @param input The file to read.
   * @param output The file to write.
   * @return The number of diagnostics, or std::nullopt when the file could
   * not be converted at all.
   */
  std::optional<std::size_t> ConvertFile(const std::string &input,
                                         const std::string &output);

  static void PrintHelp();
  static void PrintVersion();

private:
  /**
   * @brief Handles the launch settings passed as command-line arguments.
   * @return True if the program should stop after them.
   */
  bool HandleLaunchSettings();

  /**
   * @brief Converts every input named by the launch settings.
   * @return The exit status.
   */
  int Run();

  /**
   * @brief Every `*.tex` file of the current directory, sorted by name.
   */
  static std::vector<std::string> CollectInputs();

  /**
   * @brief Writes text to a file.
   * @return False when the file could not be written.
   */
  static bool WriteFile(const std::string &path, const std::string &text);

  LaunchSettings launch_settings_;
};
