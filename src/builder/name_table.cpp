#include "name_table.hpp"

#include <iterator>

namespace builder {

void NameTable::Declare(std::size_t scope, const std::string &name,
                        NameTarget target) {
  auto &declarations = names_[{scope, name}];
  auto it = declarations.end();
  while (it != declarations.begin() &&
         std::prev(it)->statement_index > target.statement_index) {
    --it;
  }
  declarations.insert(it, target);
}

std::optional<NameTarget>
NameTable::Lookup(const std::string &name,
                  const std::vector<std::size_t> &visible_scopes,
                  std::optional<std::size_t> statement_index) const {
  std::optional<NameTarget> forward;
  for (auto scope : visible_scopes) {
    auto it = names_.find({scope, name});
    if (it == names_.end()) {
      continue;
    }
    const auto &declarations = it->second;
    if (!statement_index.has_value()) {
      return declarations.back();
    }
    for (auto d = declarations.rbegin(); d != declarations.rend(); ++d) {
      if (d->statement_index <= *statement_index) {
        return *d;
      }
    }
    if (!forward.has_value()) {
      forward = declarations.front();
    }
  }
  return forward;
}

void NameTable::Remap(const std::vector<std::optional<std::size_t>> &remap) {
  for (auto it = names_.begin(); it != names_.end();) {
    auto &declarations = it->second;
    for (auto d = declarations.begin(); d != declarations.end();) {
      if (d->element >= remap.size() || !remap[d->element].has_value()) {
        d = declarations.erase(d);
        continue;
      }
      d->element = *remap[d->element];
      ++d;
    }
    if (declarations.empty()) {
      it = names_.erase(it);
      continue;
    }
    ++it;
  }
}

} // namespace builder
