#include "provision_error.h"

#include <utility>

namespace provy {

std::string_view provision_error_kind_name(provision_error_kind kind) {
  switch (kind) {
    case provision_error_kind::base_image_unavailable: return "BaseImageUnavailable";
    case provision_error_kind::package_install: return "PackageInstallError";
    case provision_error_kind::download: return "DownloadError";
    case provision_error_kind::installer_execution: return "InstallerExecutionError";
    case provision_error_kind::self_update: return "SelfUpdateError";
    case provision_error_kind::command_failed: return "CommandError";
    case provision_error_kind::commit: return "CommitError";
    case provision_error_kind::manifest: return "ManifestError";
  }
  return "UnknownError";
}

provision_error::provision_error(provision_error_kind kind,
                                 std::string const &message,
                                 std::optional<std::string> subject)
    : std::runtime_error{ message }, kind_{ kind }, subject_{ std::move(subject) } {}

}  // namespace provy
