#include "cmd_provision.h"

#include "cmd_common.h"
#include "manifest.h"
#include "platform.h"
#include "provisioner.h"
#include "tui.h"

#include "CLI11.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace provy {

void cmd_provision::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("provision", "Build an image from a provy.lua manifest") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to provy.lua manifest");
  sub->add_option("--engine",
                  cfg_ptr->engine,
                  "Container engine CLI (docker or podman); overrides the manifest "
                  "directive and PROVY_ENGINE");
  sub->add_option("--tag", cfg_ptr->tag, "Tag for the committed image");
  sub->add_option("--pull", cfg_ptr->pull, "Base image pull policy")
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, pull_policy>{ { "always", pull_policy::always },
                                              { "missing", pull_policy::missing } }));
  sub->add_flag("--keep-container",
                cfg_ptr->keep_container,
                "Leave the build container in place after the run");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_provision::cmd_provision(cmd_provision::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_provision::execute() {
  std::unique_ptr<manifest> m;
  try {
    m = load_manifest_or_throw(cfg_.manifest_path);
  } catch (provision_error const &e) {
    tui::error("%s: %s", std::string{ provision_error_kind_name(e.kind()) }.c_str(), e.what());
    return false;
  }

  auto const engine{ resolve_engine(cfg_.engine,
                                    m->meta.engine,
                                    platform::env_var_get(kEngineEnvVar)) };
  tui::info("Provisioning %s with %s", m->manifest_path.string().c_str(), engine.c_str());

  container_target target{ container_target_cfg{ .engine = engine,
                                                 .pull = cfg_.pull,
                                                 .keep_container = cfg_.keep_container } };

  auto const result{ provision(m->image,
                               target,
                               provision_options{ .file_root = m->root(), .tag = cfg_.tag }) };

  return report_provision_result(result);
}

bool report_provision_result(provision_result const &result) {
  return std::visit(
      match{
          [](provision_report const &report) {
            if (!report.warnings.empty()) {
              tui::info("Image committed with %zu warning(s)", report.warnings.size());
            }
            tui::print_stdout("%s\n", report.image_id.value_or("").c_str());
            return true;
          },
          [](provision_error const &error) {
            tui::error("Provisioning failed with %s",
                       std::string{ provision_error_kind_name(error.kind()) }.c_str());
            return false;
          },
      },
      result);
}

}  // namespace provy
