#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace provy {

enum class package_manager_kind { apt, dnf, yum, apk };

std::string_view package_manager_name(package_manager_kind kind);
std::optional<package_manager_kind> package_manager_parse(std::string_view name);

// Refreshes the package index.
std::string package_manager_refresh_script(package_manager_kind kind);

// Installs exactly one package, non-interactively.
std::string package_manager_install_script(package_manager_kind kind,
                                           std::string_view package);

// Non-empty, printable, and free of whitespace and shell metacharacters.
bool package_name_is_valid(std::string_view package);

}  // namespace provy
