#pragma once

#include "env_state.h"
#include "shell.h"
#include "util.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provy {

// The place steps are applied to. Methods throw std::runtime_error when the underlying
// engine cannot carry out the request; non-zero exits of user scripts are returned.
class target : unmovable {
 public:
  using line_cb_t = std::function<void(std::string_view)>;

  virtual ~target() = default;

  // Makes ref available, starts the build session and returns the image's default
  // environment.
  virtual env_state pull_image(std::string const &ref) = 0;

  virtual shell_result run(std::string_view script,
                           env_state const &env,
                           line_cb_t const &on_line) = 0;

  virtual bool path_exists(std::string const &path) = 0;

  virtual void copy_in(std::filesystem::path const &host_path,
                       std::string const &target_path) = 0;

  // Persists the session as an image whose default environment includes changes.
  // Returns the image id.
  virtual std::string commit(std::vector<env_state::change_t> const &changes,
                             std::optional<std::string> const &tag) = 0;

 protected:
  target() = default;
};

}  // namespace provy
