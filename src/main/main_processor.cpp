#include "main_processor.hpp"

#include "../document/convert.hpp"
#include "../fatal/fatal.hpp"
#include "../lexer/splitter.hpp"
#include "../utils/format/token_viewer.hpp"
#include "../utils/verbose/verbose.hpp"
#include "arguments_parser.hpp"
#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
constexpr std::string_view kVersion = "circuitikz-convert 0.1";
constexpr std::string_view kMissingEnvironment =
    "No circuitikz or tikzpicture environment found";
} // namespace

int MainProcessor::main(int argc, char *argv[]) {
  try {
    ArgumentsParser parser;
    launch_settings_ = parser.Parse(argc, argv);
  } catch (const std::runtime_error &error) {
    loger::non_fatal(error.what());
    PrintHelp();
    return kExitError;
  }
  if (HandleLaunchSettings()) {
    return kExitOk;
  }
  try {
    return Run();
  } catch (const std::filesystem::filesystem_error &error) {
    loger::non_fatal(error.what());
  } catch (const loger::FatalError &) {
    // Already logged.
  } catch (const std::runtime_error &error) {
    loger::non_fatal(error.what());
  }
  return kExitError;
}

int MainProcessor::Run() {
  auto inputs = launch_settings_.input_files;
  if (inputs.empty()) {
    inputs = CollectInputs();
    if (inputs.empty()) {
      loger::fatal("no .tex files found in the current directory");
    }
  }
  if (launch_settings_.output_file.has_value() && inputs.size() > 1) {
    loger::fatal("-o needs exactly one input file");
  }

  loger::ResetErrorCount();
  std::size_t diagnostics = 0;
  for (const auto &input : inputs) {
    if (auto result = ConvertFile(input, launch_settings_.OutputFileFor(input))) {
      diagnostics += *result;
    }
  }
  loger::SetFileName("");

  if (loger::GetErrorCount() > 0) {
    return kExitError;
  }
  if (launch_settings_.need_strict && diagnostics > 0) {
    return kExitDiagnostics;
  }
  return kExitOk;
}

bool MainProcessor::HandleLaunchSettings() {
  if (launch_settings_.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }
  if (launch_settings_.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  return false;
}

std::optional<std::size_t> MainProcessor::ConvertFile(const std::string &input,
                                                      const std::string &output) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  loger::SetFileName(input);

  std::ifstream in(input);
  if (!in) {
    loger::non_fatal("cannot open input file");
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto body = lexer::ExtractDrawingBody(lexer::RemoveComments(buffer.str()));
  if (!body.has_value()) {
    loger::non_fatal(kMissingEnvironment);
    Json::Value error(Json::objectValue);
    error["error"] = std::string(kMissingEnvironment);
    if (WriteFile(output, document::ToJsonString(error) + "\n") &&
        verbose_flags.NeedToPrintVerbose()) {
      std::cout << fmt::format("{}: wrote error object to {}", input, output)
                << std::endl;
    }
    return std::nullopt;
  }

  format::TokenViewer viewer(std::cout);
  document::StatementObserver observer;
  if (verbose_flags.NeedToPrintTokens()) {
    observer = [&viewer](std::size_t index, std::string_view text,
                         const std::vector<models::Token> &tokens,
                         classifier::StatementKind kind) {
      viewer.view(index, text, tokens, kind);
    };
  }

  auto result = document::Convert(
      *body, document::JsonOptions{launch_settings_.units}, observer);
  for (const auto &diagnostic : result.diagnostics) {
    loger::warning(document::Describe(diagnostic));
  }
  if (!WriteFile(output, document::ToJsonString(result.document) + "\n")) {
    return std::nullopt;
  }

  if (verbose_flags.NeedToPrintVerbose()) {
    std::cout << fmt::format("{}: wrote {} ({} elements, {} diagnostics)",
                             input, output,
                             result.document["elements"].size(),
                             result.diagnostics.size())
              << std::endl;
  }
  return result.diagnostics.size();
}

std::vector<std::string> MainProcessor::CollectInputs() {
  std::vector<std::string> inputs;
  for (const auto &entry : std::filesystem::directory_iterator(".")) {
    if (entry.is_regular_file() && entry.path().extension() == ".tex") {
      inputs.push_back(entry.path().filename().string());
    }
  }
  std::sort(inputs.begin(), inputs.end());
  return inputs;
}

bool MainProcessor::WriteFile(const std::string &path, const std::string &text) {
  std::ofstream out(path);
  if (!out) {
    loger::non_fatal(fmt::format("cannot create output file {}", path));
    return false;
  }
  out << text;
  return static_cast<bool>(out);
}

void MainProcessor::PrintHelp() {
  std::cout << "use: circuitikz-convert [-option] ... [file.tex] ...\n"
               "\t-h print this help\n"
               "\t-o file  write the JSON document to file (one input only)\n"
               "\t-s strict, exit status 2 when any statement was skipped\n"
               "\t-t print the tokens of every statement\n"
               "\t-u cm|px  output units (default px)\n"
               "\t-v verbose, more progress information\n"
               "\t-V print version number, exit\n"
               "without files, every *.tex file in the current directory is "
               "converted\n";
  std::cout.flush();
}

void MainProcessor::PrintVersion() { std::cout << kVersion << std::endl; }
