#include "provisioner.h"

#include "fetch.h"
#include "package_manager.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace provy {
namespace {

constexpr char kTargetPayloadPrefix[]{ "/tmp/provy-" };

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

// Runs fn, turning any non-provision exception into a provision_error of kind.
template <typename Fn>
auto guarded(provision_error_kind kind,
             std::string const &context,
             std::optional<std::string> const &subject,
             Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (provision_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw provision_error(kind, context + ": " + e.what(), subject);
  }
}

struct script_outcome {
  shell_result result;
  std::string last_line;
};

std::string exit_detail(script_outcome const &outcome) {
  std::string detail{ outcome.result.signal
                          ? "signal " + std::to_string(*outcome.result.signal)
                          : "exit " + std::to_string(outcome.result.exit_code) };
  if (!outcome.last_line.empty()) { detail += ": " + outcome.last_line; }
  return detail;
}

bool succeeded(script_outcome const &outcome) {
  return outcome.result.exit_code == 0 && !outcome.result.signal;
}

class executor : unmovable {
 public:
  executor(target &t, provision_options const &options) : target_{ t }, options_{ options } {}

  void execute(step const &s) {
    std::visit([this](auto const &concrete) { apply(concrete); }, s);
  }

  provision_report &report() { return report_; }
  env_state const &env() const { return env_; }

 private:
  script_outcome run_script(step_kind kind,
                            std::string const &script,
                            provision_error_kind failure_kind,
                            std::optional<std::string> const &subject) {
    auto const display{ util_flatten_script_with_semicolons(script) };
    PROVY_TRACE_COMMAND_START(kind, display);
    tui::debug("$ %s", display.c_str());

    auto const start{ std::chrono::steady_clock::now() };
    script_outcome out{};
    out.result = guarded(failure_kind, "failed to run '" + display + "'", subject, [&] {
      return target_.run(script, env_, [&](std::string_view line) {
        if (!line.empty()) { out.last_line = std::string{ line }; }
        tui::info("  %.*s", static_cast<int>(line.size()), line.data());
      });
    });

    PROVY_TRACE_COMMAND_COMPLETE(kind, out.result.exit_code, elapsed_ms(start));
    return out;
  }

  void apply(steps::pull_image const &s) {
    env_ = guarded(provision_error_kind::base_image_unavailable,
                   "base image " + s.ref + " unavailable",
                   s.ref,
                   [&] { return target_.pull_image(s.ref); });
    base_env_ = env_;
    tui::debug("Base image environment has %zu variable(s)", env_.size());
  }

  void apply(steps::install_packages const &s) {
    auto const refresh{ run_script(step_kind::install_packages,
                                   package_manager_refresh_script(s.manager),
                                   provision_error_kind::package_install,
                                   std::nullopt) };
    if (!succeeded(refresh)) {
      throw provision_error(provision_error_kind::package_install,
                            "package index refresh failed (" + exit_detail(refresh) + ")");
    }

    for (auto const &package : s.packages) {
      tui::info("Installing package %s", package.c_str());
      auto const installed{ run_script(step_kind::install_packages,
                                       package_manager_install_script(s.manager, package),
                                       provision_error_kind::package_install,
                                       package) };
      if (!succeeded(installed)) {
        throw provision_error(provision_error_kind::package_install,
                              "failed to install package '" + package + "' (" +
                                  exit_detail(installed) + ")",
                              package);
      }
      report_.installed_packages.push_back(package);
    }
  }

  void apply(steps::download_file const &s) {
    if (!workspace_) {
      workspace_ = guarded(provision_error_kind::download,
                           "failed to create a download workspace",
                           s.url,
                           [] {
                             return std::make_unique<scoped_path_cleanup>(
                                 util_make_temp_dir("provy-run"));
                           });
    }

    auto filename{ uri_extract_filename(s.url) };
    if (filename.empty()) { filename = "installer"; }
    auto const destination{ workspace_->path() / filename };

    PROVY_TRACE_FETCH_START(s.url, destination.string());
    tui::info("Downloading %s", s.url.c_str());
    auto const start{ std::chrono::steady_clock::now() };

    auto const fetched{ guarded(provision_error_kind::download,
                                "download of " + s.url + " failed",
                                s.url,
                                [&] {
                                  auto const request{ fetch_request_from_source(
                                      s.url, destination, options_.file_root) };
                                  return options_.fetcher ? options_.fetcher(request)
                                                          : fetch(request);
                                }) };

    if (s.sha256) {
      guarded(provision_error_kind::download,
              "checksum verification of " + s.url + " failed",
              s.url,
              [&] { sha256_verify(*s.sha256, sha256(fetched.resolved_destination)); });
    }

    PROVY_TRACE_FETCH_COMPLETE(s.url,
                               static_cast<std::int64_t>(fetched.bytes),
                               elapsed_ms(start));
    tui::debug("Downloaded %s", util_format_bytes(fetched.bytes).c_str());
    payload_ = fetched.resolved_destination;
  }

  void apply(steps::run_installer const &s) {
    if (!payload_) {
      throw provision_error(provision_error_kind::installer_execution,
                            "no installer payload was downloaded",
                            s.install_path);
    }

    bool const exists{ guarded(provision_error_kind::installer_execution,
                               "failed to check install path " + s.install_path,
                               s.install_path,
                               [&] { return target_.path_exists(s.install_path); }) };
    if (exists) {
      throw provision_error(provision_error_kind::installer_execution,
                            "install path already exists: " + s.install_path,
                            s.install_path);
    }

    std::string const target_payload{ kTargetPayloadPrefix + payload_->filename().string() };
    guarded(provision_error_kind::installer_execution,
            "failed to copy installer into target",
            s.install_path,
            [&] { target_.copy_in(*payload_, target_payload); });

    std::vector<std::string> argv{ s.shell, target_payload };
    argv.insert(argv.end(), s.args.begin(), s.args.end());

    tui::info("Running installer into %s", s.install_path.c_str());
    auto const installed{ run_script(step_kind::run_installer,
                                     util_shell_join(argv),
                                     provision_error_kind::installer_execution,
                                     s.install_path) };

    remove_target_payload(target_payload);

    if (!succeeded(installed)) {
      throw provision_error(provision_error_kind::installer_execution,
                            "installer failed (" + exit_detail(installed) + ")",
                            s.install_path);
    }
  }

  void apply(steps::set_env const &s) {
    std::string const base{ s.path_base ? *s.path_base
                                        : env_.get("PATH").value_or(kDefaultPath) };
    auto next{ env_.with_path_prepended(s.path_prepend, base).with_all(s.overrides) };

    for (auto const &[name, value] : next.diff(env_)) {
      PROVY_TRACE_ENV_UPDATED(name, value);
      tui::info("%s=%s", name.c_str(), value.c_str());
    }
    env_ = std::move(next);
  }

  void apply(steps::run_command const &s) {
    auto const ran{ run_script(step_kind::run_command, s.script, s.failure_kind, s.script) };
    if (!succeeded(ran)) {
      throw provision_error(s.failure_kind,
                            s.label + " failed (" + exit_detail(ran) + ")",
                            s.script);
    }
  }

  void apply(steps::commit_image const &s) {
    auto const tag{ options_.tag ? options_.tag : s.tag };
    auto const changes{ env_.diff(base_env_) };
    report_.image_id = guarded(provision_error_kind::commit,
                               "failed to commit image",
                               tag,
                               [&] { return target_.commit(changes, tag); });
    tui::info("Committed image %s", report_.image_id->c_str());
  }

  void remove_target_payload(std::string const &target_payload) {
    try {
      auto const removed{ target_.run(util_shell_join({ "rm", "-f", target_payload }),
                                      env_,
                                      {}) };
      if (removed.exit_code != 0) {
        tui::warn("Failed to remove %s from target (exit %d)",
                  target_payload.c_str(),
                  removed.exit_code);
      }
    } catch (std::exception const &e) {
      tui::warn("Failed to remove %s from target: %s", target_payload.c_str(), e.what());
    }
  }

  target &target_;
  provision_options const &options_;
  env_state env_;
  env_state base_env_;
  std::unique_ptr<scoped_path_cleanup> workspace_;
  std::optional<std::filesystem::path> payload_;
  provision_report report_;
};

std::string run_label(std::vector<step> const &steps) {
  for (auto const &s : steps) {
    if (auto const *pull{ std::get_if<steps::pull_image>(&s) }) { return pull->ref; }
  }
  return {};
}

}  // namespace

provision_result provision_steps(std::vector<step> const &steps,
                                 target &t,
                                 provision_options const &options) {
  auto const label{ run_label(steps) };
  auto const run_start{ std::chrono::steady_clock::now() };
  PROVY_TRACE_RUN_START(label, steps.size());

  executor exec{ t, options };

  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    auto const &s{ steps[i] };
    auto const kind{ step_kind_of(s) };
    auto const description{ step_describe(s) };

    tui::info("[%zu/%zu] %s", i + 1, steps.size(), description.c_str());
    step_trace_scope scope{ static_cast<std::int64_t>(i), kind, description };
    auto const start{ std::chrono::steady_clock::now() };

    step_outcome outcome{ .kind = kind,
                          .description = description,
                          .status = step_status::succeeded,
                          .message = std::nullopt,
                          .duration_ms = 0 };
    try {
      exec.execute(s);
    } catch (provision_error const &e) {
      bool const fatal{ step_is_fatal(s) };
      scope.fail(fatal, e.what());
      outcome.message = e.what();
      outcome.duration_ms = elapsed_ms(start);

      if (fatal) {
        tui::error("%s: %s",
                   std::string{ provision_error_kind_name(e.kind()) }.c_str(),
                   e.what());
        PROVY_TRACE_RUN_COMPLETE(label, false, elapsed_ms(run_start));
        return e;
      }

      tui::warn("%s: %s (continuing)",
                std::string{ provision_error_kind_name(e.kind()) }.c_str(),
                e.what());
      outcome.status = step_status::warned;
      exec.report().warnings.push_back(e);
      exec.report().steps.push_back(std::move(outcome));
      continue;
    }

    outcome.duration_ms = elapsed_ms(start);
    exec.report().steps.push_back(std::move(outcome));
  }

  PROVY_TRACE_RUN_COMPLETE(label, true, elapsed_ms(run_start));

  auto report{ std::move(exec.report()) };
  report.env = exec.env();
  return report;
}

provision_result provision(image_spec const &spec,
                           target &t,
                           provision_options const &options) {
  return provision_steps(plan(spec), t, options);
}

}  // namespace provy
