#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace provy {

class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {
    std::optional<std::filesystem::path> manifest_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_plan(cfg cfg);

  bool execute() override;

 private:
  cfg cfg_;
};

}  // namespace provy
