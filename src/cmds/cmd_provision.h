#pragma once

#include "cmd.h"
#include "container_target.h"
#include "provisioner.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace provy {

class cmd_provision : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_provision> {
    std::optional<std::filesystem::path> manifest_path;
    std::optional<std::string> engine;
    std::optional<std::string> tag;
    pull_policy pull{ pull_policy::always };
    bool keep_container{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_provision(cfg cfg);

  bool execute() override;

 private:
  cfg cfg_;
};

// Prints the image id on success. Step warnings were already logged while provisioning;
// only their count is repeated here.
bool report_provision_result(provision_result const &result);

}  // namespace provy
