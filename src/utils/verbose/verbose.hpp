#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing debug information.
 *
 * The Flags class allows controlling the verbosity flags of the driver. Use
 * the provided setter methods to enable specific flags.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags();

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to print progress information is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Check if the flag to dump the tokens of every statement is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintTokens() const;

  /**
   * @brief Clear every flag.
   */
  void Reset();

  void SetNeedToPrintVerbose();
  void SetNeedToPrintTokens();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_;
  bool need_to_print_tokens_;
};

} // namespace utils::verbose
