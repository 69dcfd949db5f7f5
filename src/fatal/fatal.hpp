#ifndef FATAL_CIRCUITIKZ_H
#define FATAL_CIRCUITIKZ_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for the conversion driver.
 *
 * Messages are prefixed with the program name and the file being converted.
 * Warnings and non-fatal errors go to standard output, fatal errors to
 * standard error.
 */
namespace loger {

/**
 * @brief Thrown by fatal() after the message was logged.
 */
class FatalError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Sets the file name used as message prefix.
 * @param file_name The input file being converted, empty for none.
 */
void SetFileName(const std::string &file_name);

/**
 * @brief Logs a warning with an optional additional message.
 * @param s1 The main message.
 * @param s2 Optional additional message.
 */
void warning(const std::string_view &s1,
             const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a fatal error and throws FatalError with the message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
[[noreturn]] void fatal(const std::string_view &s1,
                        const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Number of errors logged since the last reset.
 */
std::size_t GetErrorCount();
void ResetErrorCount();

} // namespace loger

#endif
