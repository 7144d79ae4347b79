#include "cmd_fetch.h"

#include "fetch.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace provy {

void cmd_fetch::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("fetch", "Download resource to local file") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Source URI (http/https/ftp/ftps/file)")
      ->required();
  sub->add_option("destination", cfg_ptr->destination, "Destination file path")
      ->required();
  sub->add_option("--file-root",
                  cfg_ptr->file_root,
                  "Directory for resolving relative file sources");
  sub->add_option("--sha256", cfg_ptr->sha256, "Expected SHA256 of the downloaded file");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_fetch::cmd_fetch(cmd_fetch::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_fetch::execute() {
  if (cfg_.source.empty()) { throw std::runtime_error("fetch: source URI is empty"); }
  if (cfg_.destination.empty()) {
    throw std::runtime_error("fetch: destination path is empty");
  }
  if (cfg_.sha256 && !sha256_is_valid_hex(*cfg_.sha256)) {
    throw std::runtime_error("fetch: --sha256 must be 64 hex characters");
  }

  auto const result{ fetch(
      fetch_request_from_source(cfg_.source, cfg_.destination, cfg_.file_root)) };

  if (cfg_.sha256) {
    try {
      sha256_verify(*cfg_.sha256, sha256(result.resolved_destination));
    } catch (std::exception const &) {
      std::error_code ec;
      std::filesystem::remove(result.resolved_destination, ec);
      throw;
    }
  }

  tui::debug("Fetched %s -> %s (%s)",
             result.resolved_source.string().c_str(),
             result.resolved_destination.string().c_str(),
             util_format_bytes(result.bytes).c_str());
  return true;
}

}  // namespace provy
