#include "container_target.h"

#include "tui.h"
#include "util.h"

#include <array>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace provy {
namespace {

constexpr char kEnvFormat[]{ "{{range .Config.Env}}{{println .}}{{end}}" };

std::string make_container_name() {
  std::random_device rd;
  std::array<unsigned char, 4> bytes{};
  for (auto &b : bytes) { b = static_cast<unsigned char>(rd() & 0xFF); }
  return "provy-" + util_bytes_to_hex(bytes.data(), bytes.size());
}

// Dockerfile-style ENV instruction; the value is always double-quoted.
std::string env_change_instruction(env_state::change_t const &change) {
  std::string out{ "ENV " + change.first + "=\"" };
  for (char const c : change.second) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::optional<std::string> last_non_empty(std::vector<std::string> const &lines) {
  for (auto it{ lines.rbegin() }; it != lines.rend(); ++it) {
    if (!it->empty()) { return *it; }
  }
  return std::nullopt;
}

// Engines report errors on stderr; fall back to stdout for runners that merge them.
template <typename Invocation>
std::string failure_detail(Invocation const &inv) {
  std::string detail{ inv.result.signal ? "signal " + std::to_string(*inv.result.signal)
                                        : "exit " + std::to_string(inv.result.exit_code) };
  auto line{ last_non_empty(inv.err_lines) };
  if (!line) { line = last_non_empty(inv.lines); }
  return line ? detail + ": " + *line : detail;
}

}  // namespace

std::string_view pull_policy_name(pull_policy policy) {
  switch (policy) {
    case pull_policy::always: return "always";
    case pull_policy::missing: return "missing";
  }
  return "unknown";
}

container_runner_t container_default_runner() {
  return [](std::string_view command,
            std::function<void(std::string_view)> const &on_stdout,
            std::function<void(std::string_view)> const &on_stderr) -> shell_result {
    return shell_run(command,
                     shell_run_cfg{ .on_stdout_line = on_stdout,
                                    .on_stderr_line = on_stderr,
                                    .env = shell_getenv() });
  };
}

container_target::container_target(container_target_cfg cfg, container_runner_t runner)
    : cfg_{ std::move(cfg) }, runner_{ std::move(runner) } {
  if (cfg_.engine.empty()) { throw std::invalid_argument("container engine is empty"); }
  if (!runner_) { throw std::invalid_argument("container runner is empty"); }
  if (cfg_.container_name.empty()) { cfg_.container_name = make_container_name(); }
}

container_target::~container_target() {
  if (!started_) { return; }

  if (cfg_.keep_container) {
    tui::info("Keeping build container %s", cfg_.container_name.c_str());
    return;
  }

  try {
    auto const removed{ invoke({ "rm", "-f", cfg_.container_name }) };
    if (removed.result.exit_code != 0) {
      tui::warn("Failed to remove build container %s (%s)",
                cfg_.container_name.c_str(),
                failure_detail(removed).c_str());
    }
  } catch (std::exception const &e) {
    tui::warn("Failed to remove build container %s: %s",
              cfg_.container_name.c_str(),
              e.what());
  }
}

env_state container_target::pull_image(std::string const &ref) {
  if (started_) {
    throw std::logic_error("build container " + cfg_.container_name + " already started");
  }

  bool present{ false };
  if (cfg_.pull == pull_policy::missing) {
    present = invoke({ "image", "inspect", "--format", "{{.Id}}", ref }).result.exit_code == 0;
  }

  if (present) {
    tui::debug("Image %s present, skipping pull", ref.c_str());
  } else {
    tui::debug("Pulling %s (pull policy %s)",
               ref.c_str(),
               std::string{ pull_policy_name(cfg_.pull) }.c_str());
    invoke_checked({ "pull", ref }, "pull image " + ref);
  }

  auto const inspected{ invoke_checked({ "image", "inspect", "--format", kEnvFormat, ref },
                                       "inspect image " + ref) };

  invoke_checked({ "run",
                   "-d",
                   "--name",
                   cfg_.container_name,
                   "--entrypoint",
                   "",
                   ref,
                   "tail",
                   "-f",
                   "/dev/null" },
                 "start build container from " + ref);
  started_ = true;

  return env_state::from_lines(inspected.lines);
}

shell_result container_target::run(std::string_view script,
                                   env_state const &env,
                                   line_cb_t const &on_line) {
  require_started("run");

  std::vector<std::string> args{ "exec" };
  for (auto const &[name, value] : env.vars()) {
    args.push_back("-e");
    args.push_back(name + "=" + value);
  }
  args.push_back(cfg_.container_name);
  args.push_back("/bin/sh");
  args.push_back("-c");
  args.emplace_back(script);

  return invoke(std::move(args), on_line).result;
}

bool container_target::path_exists(std::string const &path) {
  require_started("path_exists");

  auto const probe{ invoke({ "exec", cfg_.container_name, "test", "-e", path }) };
  if (probe.result.exit_code == 0) { return true; }
  if (probe.result.exit_code == 1 && !probe.result.signal) { return false; }
  throw std::runtime_error("failed to check " + path + " in build container (" +
                           failure_detail(probe) + ")");
}

void container_target::copy_in(std::filesystem::path const &host_path,
                               std::string const &target_path) {
  require_started("copy_in");
  invoke_checked({ "cp", host_path.string(), cfg_.container_name + ":" + target_path },
                 "copy " + host_path.string() + " to " + target_path);
}

std::string container_target::commit(std::vector<env_state::change_t> const &changes,
                                     std::optional<std::string> const &tag) {
  require_started("commit");

  std::vector<std::string> args{ "commit" };
  for (auto const &change : changes) {
    args.push_back("--change");
    args.push_back(env_change_instruction(change));
  }
  args.push_back(cfg_.container_name);
  if (tag) { args.push_back(*tag); }

  auto const committed{ invoke_checked(std::move(args), "commit build container") };
  if (auto id{ last_non_empty(committed.lines) }) { return std::move(*id); }
  throw std::runtime_error("commit build container: engine printed no image id");
}

container_target::invocation container_target::invoke(std::vector<std::string> args,
                                                       line_cb_t const &on_line) {
  args.insert(args.begin(), cfg_.engine);
  auto const command{ util_shell_join(args) };
  tui::debug("%s", command.c_str());

  // Script output (exec) goes to on_line from both streams. Engine stderr is never
  // parsed as a result; without on_line it only reaches the debug log.
  invocation out{};
  out.result = runner_(
      command,
      [&](std::string_view line) {
        out.lines.emplace_back(line);
        if (on_line) { on_line(line); }
      },
      [&](std::string_view line) {
        out.err_lines.emplace_back(line);
        if (on_line) {
          on_line(line);
        } else {
          tui::debug("%s: %.*s",
                     cfg_.engine.c_str(),
                     static_cast<int>(line.size()),
                     line.data());
        }
      });
  return out;
}

container_target::invocation container_target::invoke_checked(std::vector<std::string> args,
                                                               std::string_view what) {
  auto out{ invoke(std::move(args)) };
  if (out.result.exit_code != 0 || out.result.signal) {
    throw std::runtime_error(std::string{ what } + " failed (" +
                             failure_detail(out) + ")");
  }
  return out;
}

void container_target::require_started(std::string_view what) const {
  if (!started_) {
    throw std::logic_error(std::string{ what } + ": build container not started");
  }
}

}  // namespace provy
