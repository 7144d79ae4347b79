#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace provy {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
};

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  shell_env_t env;  // the child's entire environment
};

shell_env_t shell_getenv();

// Runs `/bin/sh -c command` with stdin from /dev/null. Each stream is split into lines and
// delivered to its own callback; a final unterminated line is delivered at EOF. Blocks
// until the child exits. A throwing callback kills the child and propagates.
shell_result shell_run(std::string_view command, shell_run_cfg const &cfg);

}  // namespace provy
