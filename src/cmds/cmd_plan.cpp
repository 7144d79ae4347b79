#include "cmd_plan.h"

#include "cmd_common.h"
#include "manifest.h"
#include "step.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <string>

namespace provy {

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan", "Print the steps a manifest would run") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to provy.lua manifest");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_plan::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const steps{ plan(m->image) };

  tui::debug("Planned %zu step(s) from %s", steps.size(), m->manifest_path.string().c_str());
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    tui::print_stdout("%zu. %s%s\n",
                      i + 1,
                      step_describe(steps[i]).c_str(),
                      step_is_fatal(steps[i]) ? "" : " [non-fatal]");
  }
  return true;
}

}  // namespace provy
