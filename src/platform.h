#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace provy::platform {

std::filesystem::path get_exe_path();

// Expand ~ and $VAR references without running commands. Throws on undefined variables.
std::filesystem::path expand_path(std::string_view p);

std::optional<std::string> env_var_get(char const *name);

}  // namespace provy::platform
