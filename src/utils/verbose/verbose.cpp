#include "verbose.hpp"

namespace utils::verbose {

Flags::Flags() : need_to_print_verbose_(false), need_to_print_tokens_(false) {}

bool Flags::NeedToPrintVerbose() const { return need_to_print_verbose_; }

bool Flags::NeedToPrintTokens() const { return need_to_print_tokens_; }

void Flags::Reset() {
  need_to_print_verbose_ = false;
  need_to_print_tokens_ = false;
}

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::SetNeedToPrintTokens() { need_to_print_tokens_ = true; }

} // namespace utils::verbose
