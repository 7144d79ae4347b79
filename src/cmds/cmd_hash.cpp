#include "cmd_hash.h"

#include "sha256.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>

namespace provy {

void cmd_hash::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("hash", "Compute SHA256 hash of a file") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("file", cfg_ptr->file_path, "File to hash")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_hash::cmd_hash(cmd_hash::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_hash::execute() {
  if (cfg_.file_path.empty()) { throw std::runtime_error("hash: file path is required"); }

  if (!std::filesystem::exists(cfg_.file_path)) {
    throw std::runtime_error("hash: file does not exist: " + cfg_.file_path.string());
  }

  if (std::filesystem::is_directory(cfg_.file_path)) {
    throw std::runtime_error("hash: path is a directory: " + cfg_.file_path.string());
  }

  tui::print_stdout("%s\n", sha256_hex(sha256(cfg_.file_path)).c_str());
  return true;
}

}  // namespace provy
