#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace {
// Value of `-uVALUE` or `-u VALUE`; consumes the separate argument.
std::string OptionValue(int &argc, char **&argv) {
  char option = argv[1][1];
  if (argv[1][2] != '\0') {
    return std::string(&argv[1][2]);
  }
  if (argc < 3) {
    throw std::runtime_error(fmt::format("missing argument to -{}", option));
  }
  argc--;
  argv++;
  return std::string(argv[1]);
}
} // namespace

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  while (argc > 1) {
    if (argv[1][0] != '-' || argv[1][1] == '\0') {
      result.input_files.push_back(argv[1]);
      argc--;
      argv++;
      continue;
    }
    switch (argv[1][1]) {
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    case 'v': {
      verbose_flags.SetNeedToPrintVerbose();
      break;
    }
    case 't': {
      verbose_flags.SetNeedToPrintTokens();
      break;
    }
    case 's': {
      result.need_strict = true;
      break;
    }
    case 'u': {
      result.SetUnits(OptionValue(argc, argv));
      break;
    }
    case 'o': {
      result.output_file = OptionValue(argc, argv);
      break;
    }
    default: {
      result.need_to_print_help_and_stop = true;
      break;
    }
    }
    argc--;
    argv++;
  }
  return result;
}
