#pragma once

#include "env_state.h"
#include "fetch.h"
#include "image_spec.h"
#include "provision_error.h"
#include "step.h"
#include "target.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace provy {

enum class step_status { succeeded, warned };

struct step_outcome {
  step_kind kind;
  std::string description;
  step_status status;
  std::optional<std::string> message;
  std::int64_t duration_ms;
};

struct provision_report {
  env_state env;                            // final environment
  std::vector<step_outcome> steps;          // one per executed step
  std::vector<provision_error> warnings;    // non-fatal step failures
  std::vector<std::string> installed_packages;
  std::optional<std::string> image_id;      // set once the commit step succeeds
};

struct provision_options {
  std::optional<std::filesystem::path> file_root;  // anchors relative installer sources
  std::optional<std::string> tag;                  // overrides the commit step's tag
  std::function<fetch_result(fetch_request const &)> fetcher;  // empty: fetch()
};

using provision_result = std::variant<provision_report, provision_error>;

// Executes steps in order against target, stopping at the first fatal failure.
// Failures of non-fatal steps are logged and recorded as warnings.
provision_result provision_steps(std::vector<step> const &steps,
                                 target &t,
                                 provision_options const &options = {});

provision_result provision(image_spec const &spec,
                           target &t,
                           provision_options const &options = {});

}  // namespace provy
