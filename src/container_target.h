#pragma once

#include "target.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provy {

enum class pull_policy { always, missing };

std::string_view pull_policy_name(pull_policy policy);

// Runs one host shell command line, forwarding stdout and stderr lines separately.
using container_runner_t =
    std::function<shell_result(std::string_view command,
                               std::function<void(std::string_view)> const &on_stdout,
                               std::function<void(std::string_view)> const &on_stderr)>;

// Host /bin/sh with the process environment.
container_runner_t container_default_runner();

struct container_target_cfg {
  std::string engine{ "docker" };  // docker or podman; both accept the same CLI subset
  pull_policy pull{ pull_policy::always };
  bool keep_container{ false };
  std::string container_name;  // empty: a random provy-xxxxxxxx name
};

// A long-lived build container driven through the engine CLI. Removed on destruction
// unless keep_container is set.
class container_target : public target {
 public:
  explicit container_target(container_target_cfg cfg,
                            container_runner_t runner = container_default_runner());
  ~container_target() override;

  env_state pull_image(std::string const &ref) override;
  shell_result run(std::string_view script,
                   env_state const &env,
                   line_cb_t const &on_line) override;
  bool path_exists(std::string const &path) override;
  void copy_in(std::filesystem::path const &host_path,
               std::string const &target_path) override;
  std::string commit(std::vector<env_state::change_t> const &changes,
                     std::optional<std::string> const &tag) override;

  std::string const &container_name() const { return cfg_.container_name; }
  bool started() const { return started_; }

 private:
  // Only stdout is parsed; stderr is kept for diagnostics.
  struct invocation {
    shell_result result;
    std::vector<std::string> lines;
    std::vector<std::string> err_lines;
  };

  invocation invoke(std::vector<std::string> args, line_cb_t const &on_line = {});
  invocation invoke_checked(std::vector<std::string> args, std::string_view what);
  void require_started(std::string_view what) const;

  container_target_cfg cfg_;
  container_runner_t runner_;
  bool started_{ false };
};

}  // namespace provy
