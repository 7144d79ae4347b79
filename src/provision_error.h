#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace provy {

enum class provision_error_kind {
  base_image_unavailable,
  package_install,
  download,
  installer_execution,
  self_update,
  command_failed,
  commit,
  manifest,
};

std::string_view provision_error_kind_name(provision_error_kind kind);

class provision_error : public std::runtime_error {
 public:
  provision_error(provision_error_kind kind,
                  std::string const &message,
                  std::optional<std::string> subject = std::nullopt);

  provision_error_kind kind() const noexcept { return kind_; }

  // Package name, URL, path or command the error is about, when there is one.
  std::optional<std::string> const &subject() const noexcept { return subject_; }

 private:
  provision_error_kind kind_;
  std::optional<std::string> subject_;
};

}  // namespace provy
