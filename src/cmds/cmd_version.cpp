#include "cmd_version.h"

#include "libcurl_util.h"
#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"
#include "mbedtls/version.h"
#include "sol/sol.hpp"

#include <array>
#include <memory>

#ifndef PROVY_VERSION_STR
#error "PROVY_VERSION_STR must be defined by the build system"
#endif

namespace provy {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("provy version %s (%s)",
            PROVY_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  libcurl: %s", libcurl_version().c_str());

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace provy
