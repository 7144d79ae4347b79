#pragma once

#include "image_spec.h"
#include "package_manager.h"
#include "provision_error.h"
#include "step_kind.h"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace provy {

namespace steps {

struct pull_image {
  std::string ref;

  bool operator==(pull_image const &) const = default;
};

struct install_packages {
  package_manager_kind manager;
  std::vector<std::string> packages;  // installed one at a time, in this order

  bool operator==(install_packages const &) const = default;
};

struct download_file {
  std::string url;
  std::optional<std::string> sha256;

  bool operator==(download_file const &) const = default;
};

// Runs the payload fetched by the preceding download_file step.
struct run_installer {
  std::string install_path;
  std::string shell;
  std::vector<std::string> args;

  bool operator==(run_installer const &) const = default;
};

struct set_env {
  std::vector<std::string> path_prepend;
  std::optional<std::string> path_base;  // nullopt: current PATH, else kDefaultPath
  std::map<std::string, std::string> overrides;

  bool operator==(set_env const &) const = default;
};

struct run_command {
  std::string label;
  std::string script;
  bool fatal;
  provision_error_kind failure_kind;

  bool operator==(run_command const &) const = default;
};

struct commit_image {
  std::optional<std::string> tag;

  bool operator==(commit_image const &) const = default;
};

}  // namespace steps

using step = std::variant<steps::pull_image,
                          steps::install_packages,
                          steps::download_file,
                          steps::run_installer,
                          steps::set_env,
                          steps::run_command,
                          steps::commit_image>;

step_kind step_kind_of(step const &s);

// One-line human-readable summary, used for logs, traces and `provy plan`.
std::string step_describe(step const &s);

// False only for run_command steps declared non-fatal.
bool step_is_fatal(step const &s);

// Pure and deterministic. Steps without input (no packages, no installer, no
// self-update) are omitted; the plan always starts with pull_image and ends with
// commit_image.
std::vector<step> plan(image_spec const &spec);

}  // namespace provy
