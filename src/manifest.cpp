#include "manifest.h"

#include "provision_error.h"
#include "tui.h"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace provy {

namespace {

size_t skip_whitespace(std::string_view s, size_t pos) {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) { ++pos; }
  return pos;
}

std::string_view parse_identifier(std::string_view s, size_t &pos) {
  size_t const start{ pos };
  while ((pos < s.size()) && (std::isalnum(static_cast<unsigned char>(s[pos])) ||
                              s[pos] == '_' || s[pos] == '-')) {
    ++pos;
  }
  return s.substr(start, pos - start);
}

// Expects pos at the opening quote; advances past the closing quote
std::optional<std::string> parse_quoted_value(std::string_view s, size_t &pos) {
  if (pos >= s.size() || s[pos] != '"') { return std::nullopt; }
  ++pos;

  std::string result;
  while (pos < s.size() && s[pos] != '"') {
    if (s[pos] == '\\' && pos + 1 < s.size()) {
      char const next{ s[pos + 1] };
      if (next == '"' || next == '\\') {
        result += next;
        pos += 2;
        continue;
      }
    }

    result += s[pos];
    ++pos;
  }

  if (pos >= s.size()) { return std::nullopt; }
  ++pos;
  return result;
}

std::optional<std::pair<std::string, std::string>> parse_directive_line(
    std::string_view line) {
  constexpr std::string_view kMarker{ "@provy" };

  size_t pos{ skip_whitespace(line, 0) };

  if (pos + 2 > line.size() || line[pos] != '-' || line[pos + 1] != '-') {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos + 2);

  if (line.substr(pos, kMarker.size()) != kMarker) { return std::nullopt; }
  pos += kMarker.size();

  if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos);

  auto const key{ parse_identifier(line, pos) };
  if (key.empty()) { return std::nullopt; }

  pos = skip_whitespace(line, pos);

  auto value{ parse_quoted_value(line, pos) };
  if (!value) { return std::nullopt; }

  return std::make_pair(std::string{ key }, std::move(*value));
}

}  // namespace

provy_meta parse_provy_meta(std::string_view content) {
  provy_meta result;
  size_t line_start{ 0 };

  while (line_start < content.size()) {
    size_t const line_end{ content.find('\n', line_start) };
    auto const line{ content.substr(
        line_start,
        (line_end == std::string_view::npos ? content.size() : line_end) - line_start) };

    if (auto const directive{ parse_directive_line(line) }) {
      auto const &[key, value]{ *directive };
      if (key == "engine") {
        result.engine = value;
      } else if (key == "tag") {
        result.tag = value;
      } else {
        tui::warn("Ignoring unknown @provy directive '%s'", key.c_str());
      }
    }

    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }

  return result;
}

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / kManifestFilename };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error(std::string{ "manifest not found: no " } + kManifestFilename +
                           " in this directory or its parents");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  return load(util_load_file(manifest_path), manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::vector<unsigned char> const &content,
                                         std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest (%zu bytes)", content.size());
  std::string const script{ reinterpret_cast<char const *>(content.data()),
                            content.size() };

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;
  m->meta = parse_provy_meta(script);

  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw provision_error{ provision_error_kind::manifest,
                           std::string("Failed to execute manifest script: ") + err.what() };
  }

  sol::object const image_obj{ (*state)["IMAGE"] };
  if (!image_obj.valid() || image_obj.get_type() != sol::type::table) {
    throw provision_error{ provision_error_kind::manifest,
                           "Manifest must define 'IMAGE' global as a table" };
  }

  m->image = image_spec_parse(image_obj.as<sol::table>());
  if (!m->image.tag && m->meta.tag) { m->image.tag = m->meta.tag; }

  return m;
}

std::unique_ptr<manifest> manifest::load(char const *script,
                                         std::filesystem::path const &manifest_path) {
  return load(std::vector<unsigned char>(script, script + std::strlen(script)),
              manifest_path);
}

}  // namespace provy
