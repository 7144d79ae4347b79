#include "cmd_common.h"

#include "manifest.h"
#include "platform.h"

#include <stdexcept>

namespace provy {

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  std::optional<std::filesystem::path> expanded;
  if (manifest_path) { expanded = platform::expand_path(manifest_path->string()); }

  auto const path{ manifest::find_manifest_path(expanded) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

std::string resolve_engine(std::optional<std::string> const &cli_engine,
                           std::optional<std::string> const &directive_engine,
                           std::optional<std::string> const &env_engine) {
  for (auto const *candidate : { &cli_engine, &directive_engine, &env_engine }) {
    if (*candidate && !(*candidate)->empty()) { return **candidate; }
  }
  return kDefaultEngine;
}

}  // namespace provy
