#pragma once
#include "launch_settings.hpp"

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating launch settings.
 */
class ArgumentsParser {
public:
    /**
     * @brief Parses the command-line arguments and generates launch settings.
     * @param[in] argc The number of command-line arguments.
     * @param[in] argv The array of command-line arguments.
     * @return The generated launch settings based on the parsed command-line arguments.
     * @throws std::runtime_error when an option value is missing or invalid.
     */
    LaunchSettings Parse(int argc, char **argv);
};
