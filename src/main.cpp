#include "cli.h"
#include "libcurl_util.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  provy::tui::init();

  auto args{ provy::cli_parse(argc, argv) };
  provy::tui::configure_trace_outputs(args.trace_outputs);
  provy::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      provy::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    provy::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return provy::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    provy::libcurl_ensure_initialized();
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    provy::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
