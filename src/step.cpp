#include "step.h"

#include "env_state.h"
#include "util.h"

#include <string>
#include <utility>

namespace provy {

step_kind step_kind_of(step const &s) {
  return std::visit(match{
                        [](steps::pull_image const &) { return step_kind::pull_image; },
                        [](steps::install_packages const &) {
                          return step_kind::install_packages;
                        },
                        [](steps::download_file const &) { return step_kind::download_file; },
                        [](steps::run_installer const &) { return step_kind::run_installer; },
                        [](steps::set_env const &) { return step_kind::set_env; },
                        [](steps::run_command const &) { return step_kind::run_command; },
                        [](steps::commit_image const &) { return step_kind::commit_image; },
                    },
                    s);
}

std::string step_describe(step const &s) {
  return std::visit(
      match{
          [](steps::pull_image const &p) { return "pull " + p.ref; },
          [](steps::install_packages const &p) {
            return "install " + std::to_string(p.packages.size()) + " package(s) with " +
                   std::string{ package_manager_name(p.manager) } + ": " +
                   util_join(p.packages, " ");
          },
          [](steps::download_file const &p) {
            return "download " + p.url + (p.sha256 ? " (sha256 " + *p.sha256 + ")" : "");
          },
          [](steps::run_installer const &p) {
            return "run installer into " + p.install_path + ": " + p.shell + " <payload> " +
                   util_shell_join(p.args);
          },
          [](steps::set_env const &p) {
            std::string out{ "set PATH=" +
                             path_prepend(p.path_prepend, p.path_base.value_or("$PATH")) };
            for (auto const &[name, value] : p.overrides) { out += " " + name + "=" + value; }
            return out;
          },
          [](steps::run_command const &p) {
            return p.label + (p.fatal ? "" : " (non-fatal)") + ": " +
                   util_flatten_script_with_semicolons(p.script);
          },
          [](steps::commit_image const &p) {
            return p.tag ? "commit image as " + *p.tag : std::string{ "commit image" };
          },
      },
      s);
}

bool step_is_fatal(step const &s) {
  if (auto const *cmd{ std::get_if<steps::run_command>(&s) }) { return cmd->fatal; }
  return true;
}

std::vector<step> plan(image_spec const &spec) {
  std::vector<step> out;

  out.emplace_back(steps::pull_image{ .ref = spec.base_image });

  if (!spec.packages.empty()) {
    out.emplace_back(
        steps::install_packages{ .manager = spec.package_manager, .packages = spec.packages });
  }

  if (spec.installer_url && spec.installer_path) {
    out.emplace_back(
        steps::download_file{ .url = *spec.installer_url, .sha256 = spec.installer_sha256 });
    out.emplace_back(steps::run_installer{ .install_path = *spec.installer_path,
                                           .shell = spec.installer_shell,
                                           .args = image_spec_installer_argv(spec) });
  }

  out.emplace_back(steps::set_env{ .path_prepend = spec.path_prepend,
                                   .path_base = spec.path_env_base,
                                   .overrides = spec.env });

  if (spec.self_update) {
    out.emplace_back(steps::run_command{ .label = "self-update",
                                         .script = *spec.self_update,
                                         .fatal = false,
                                         .failure_kind = provision_error_kind::self_update });
  }

  for (std::size_t i{ 0 }; i < spec.commands.size(); ++i) {
    auto const &cmd{ spec.commands[i] };
    out.emplace_back(steps::run_command{
        .label = "command " + std::to_string(i + 1),
        .script = cmd.run,
        .fatal = cmd.fatal,
        .failure_kind = provision_error_kind::command_failed,
    });
  }

  out.emplace_back(steps::commit_image{ .tag = spec.tag });
  return out;
}

}  // namespace provy
