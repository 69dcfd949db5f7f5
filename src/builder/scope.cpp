#include "scope.hpp"

namespace builder {
ScopeProcessor::ScopeProcessor() : stack_{0}, next_id_(1) {}

std::size_t ScopeProcessor::AddScope() {
  stack_.push_back(next_id_);
  return next_id_++;
}

std::optional<std::size_t> ScopeProcessor::RemoveScope() {
  if (stack_.size() == 1) {
    return std::nullopt;
  }
  auto scope = stack_.back();
  stack_.pop_back();
  return scope;
}

std::vector<std::size_t> ScopeProcessor::ForceClose() {
  std::vector<std::size_t> closed;
  while (auto scope = RemoveScope()) {
    closed.push_back(*scope);
  }
  return closed;
}

std::vector<std::size_t> ScopeProcessor::GetVisibleScopes() const {
  return {stack_.rbegin(), stack_.rend()};
}
} // namespace builder
