#include "step_kind.h"

#include <array>
#include <utility>

namespace provy {
namespace {

constexpr std::array<std::pair<step_kind, std::string_view>, step_kind_count> kNames{ {
    { step_kind::pull_image, "pull_image" },
    { step_kind::install_packages, "install_packages" },
    { step_kind::download_file, "download_file" },
    { step_kind::run_installer, "run_installer" },
    { step_kind::set_env, "set_env" },
    { step_kind::run_command, "run_command" },
    { step_kind::commit_image, "commit_image" },
} };

}  // namespace

std::string_view step_kind_name(step_kind k) {
  for (auto const &[kind, name] : kNames) {
    if (kind == k) { return name; }
  }
  return "unknown";
}

}  // namespace provy
