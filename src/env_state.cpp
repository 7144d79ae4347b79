#include "env_state.h"

#include "util.h"

namespace provy {

std::string path_prepend(std::vector<std::string> const &prepend, std::string_view base) {
  if (prepend.empty()) { return std::string{ base }; }
  auto result{ util_join(prepend, ":") };
  if (!base.empty()) {
    result.push_back(':');
    result.append(base);
  }
  return result;
}

env_state::env_state(map_t vars) : vars_{ std::move(vars) } {}

env_state env_state::from_lines(std::vector<std::string> const &lines) {
  map_t vars;
  for (auto const &line : lines) {
    auto const sep{ line.find('=') };
    if (sep == std::string::npos || sep == 0) { continue; }
    vars.insert_or_assign(line.substr(0, sep), line.substr(sep + 1));
  }
  return env_state{ std::move(vars) };
}

std::optional<std::string> env_state::get(std::string_view name) const {
  if (auto const it{ vars_.find(name) }; it != vars_.end()) { return it->second; }
  return std::nullopt;
}

bool env_state::contains(std::string_view name) const {
  return vars_.find(name) != vars_.end();
}

env_state env_state::with(std::string name, std::string value) const {
  auto vars{ vars_ };
  vars.insert_or_assign(std::move(name), std::move(value));
  return env_state{ std::move(vars) };
}

env_state env_state::with_all(std::map<std::string, std::string> const &overrides) const {
  auto vars{ vars_ };
  for (auto const &[name, value] : overrides) { vars.insert_or_assign(name, value); }
  return env_state{ std::move(vars) };
}

env_state env_state::with_path_prepended(std::vector<std::string> const &prepend,
                                         std::string_view base) const {
  return with("PATH", path_prepend(prepend, base));
}

std::vector<env_state::change_t> env_state::diff(env_state const &base) const {
  std::vector<change_t> changes;
  for (auto const &[name, value] : vars_) {
    auto const it{ base.vars_.find(name) };
    if (it == base.vars_.end() || it->second != value) { changes.emplace_back(name, value); }
  }
  return changes;
}

}  // namespace provy
