#pragma once

#include "image_spec.h"
#include "sol_util.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provy {

inline constexpr char kManifestFilename[]{ "provy.lua" };

// Header directives: -- @provy <key> "<value>"
struct provy_meta {
  std::optional<std::string> engine;
  std::optional<std::string> tag;
};

provy_meta parse_provy_meta(std::string_view content);

struct manifest : unmovable {
  std::filesystem::path manifest_path;
  provy_meta meta;
  image_spec image;

  manifest() = default;

  // Use explicit_path if given, otherwise discover from the current directory.
  // Returns an absolute path or throws if not found.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Searches upward for provy.lua, stopping at a directory containing a .git directory.
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::vector<unsigned char> const &content,
                                        std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(char const *script,
                                        std::filesystem::path const &manifest_path);

  std::filesystem::path root() const { return manifest_path.parent_path(); }
};

}  // namespace provy
