#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace provy {

struct manifest;

inline constexpr char kEngineEnvVar[]{ "PROVY_ENGINE" };
inline constexpr char kDefaultEngine[]{ "docker" };

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

// First non-empty of: command line, manifest directive, PROVY_ENGINE, docker.
std::string resolve_engine(std::optional<std::string> const &cli_engine,
                           std::optional<std::string> const &directive_engine,
                           std::optional<std::string> const &env_engine);

}  // namespace provy
