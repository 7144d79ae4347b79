#pragma once

#include <string_view>

namespace provy {

enum class step_kind : int {
  pull_image = 0,
  install_packages = 1,
  download_file = 2,
  run_installer = 3,
  set_env = 4,
  run_command = 5,
  commit_image = 6,
};

constexpr int step_kind_count = 7;

std::string_view step_kind_name(step_kind k);

}  // namespace provy
