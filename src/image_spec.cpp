#include "image_spec.h"

#include "provision_error.h"
#include "sha256.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace provy {
namespace {

constexpr char kContext[]{ "IMAGE" };

[[noreturn]] void fail(std::string const &message) {
  throw provision_error{ provision_error_kind::manifest, message };
}

bool has_whitespace(std::string_view value) {
  return std::ranges::any_of(value,
                             [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_env_name(std::string_view name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
    return false;
  }
  return std::ranges::all_of(name, [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '_';
  });
}

std::vector<extra_command> parse_commands(sol::table const &table) {
  auto const list{ sol_util_get_optional<sol::table>(table, "commands", kContext) };
  if (!list) { return {}; }

  std::vector<extra_command> result;
  for (std::size_t i{ 1 }; i <= list->size(); ++i) {
    sol::object const entry{ (*list)[i] };
    std::string const ctx{ std::string{ kContext } + ".commands[" + std::to_string(i) + "]" };

    if (entry.get_type() == sol::type::string) {
      result.push_back(extra_command{ .run = entry.as<std::string>() });
    } else if (entry.get_type() == sol::type::table) {
      sol::table const t{ entry.as<sol::table>() };
      result.push_back(extra_command{
          .run = sol_util_get_required<std::string>(t, "run", ctx),
          .fatal = sol_util_get_or_default<bool>(t, "fatal", true, ctx),
      });
    } else {
      throw std::runtime_error(ctx + " must be a string or a table");
    }
  }
  return result;
}

}  // namespace

image_spec image_spec_parse(sol::table const &table) {
  image_spec spec;
  try {
    spec.base_image = sol_util_get_required<std::string>(table, "base_image", kContext);
    spec.packages =
        sol_util_get_string_array(table, "packages", kContext).value_or(spec.packages);

    if (auto const pm{ sol_util_get_optional<std::string>(table, "package_manager", kContext) }) {
      auto const kind{ package_manager_parse(*pm) };
      if (!kind) { fail("IMAGE: unknown package_manager '" + *pm + "'"); }
      spec.package_manager = *kind;
    }

    spec.installer_url = sol_util_get_optional<std::string>(table, "installer_url", kContext);
    spec.installer_path =
        sol_util_get_optional<std::string>(table, "installer_path", kContext);
    spec.installer_sha256 =
        sol_util_get_optional<std::string>(table, "installer_sha256", kContext);
    spec.installer_shell = sol_util_get_or_default<std::string>(table,
                                                                "installer_shell",
                                                                spec.installer_shell,
                                                                kContext);
    spec.installer_args = sol_util_get_string_array(table, "installer_args", kContext)
                              .value_or(spec.installer_args);

    spec.path_prepend = sol_util_get_string_array(table, "path_prepend", kContext)
                            .value_or(spec.path_prepend);
    spec.path_env_base = sol_util_get_optional<std::string>(table, "path_env_base", kContext);
    if (auto env{ sol_util_get_string_map(table, "env", kContext) }) {
      spec.env = std::move(*env);
    }

    spec.self_update = sol_util_get_optional<std::string>(table, "self_update", kContext);
    spec.commands = parse_commands(table);
    spec.tag = sol_util_get_optional<std::string>(table, "tag", kContext);
  } catch (provision_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw provision_error{ provision_error_kind::manifest, e.what() };
  }

  image_spec_validate(spec);
  return spec;
}

void image_spec_validate(image_spec const &spec) {
  if (spec.base_image.empty() || has_whitespace(spec.base_image)) {
    fail("IMAGE: base_image must be a non-empty image reference");
  }

  std::set<std::string_view> seen;
  for (auto const &pkg : spec.packages) {
    if (!package_name_is_valid(pkg)) { fail("IMAGE: invalid package name '" + pkg + "'"); }
    if (!seen.insert(pkg).second) { fail("IMAGE: duplicate package '" + pkg + "'"); }
  }

  if (spec.installer_url.has_value() != spec.installer_path.has_value()) {
    fail("IMAGE: installer_url and installer_path must be given together");
  }

  if (spec.installer_url) {
    if (spec.installer_url->empty()) { fail("IMAGE: installer_url is empty"); }
    if (spec.installer_path->empty() || spec.installer_path->front() != '/') {
      fail("IMAGE: installer_path must be an absolute path, got '" + *spec.installer_path +
           "'");
    }
    if (spec.installer_shell.empty() || has_whitespace(spec.installer_shell)) {
      fail("IMAGE: installer_shell must be a single executable name");
    }
  } else if (spec.installer_sha256) {
    fail("IMAGE: installer_sha256 given without installer_url");
  }

  if (spec.installer_sha256 && !sha256_is_valid_hex(*spec.installer_sha256)) {
    fail("IMAGE: installer_sha256 must be 64 hex characters");
  }

  for (auto const &dir : spec.path_prepend) {
    if (dir.empty() || dir.find(':') != std::string::npos) {
      fail("IMAGE: path_prepend entries must be non-empty and contain no ':', got '" + dir +
           "'");
    }
  }

  for (auto const &[name, value] : spec.env) {
    if (!is_env_name(name)) { fail("IMAGE: invalid env name '" + name + "'"); }
    if (name == "PATH") { fail("IMAGE: set PATH with path_prepend and path_env_base"); }
  }

  if (spec.self_update && spec.self_update->empty()) { fail("IMAGE: self_update is empty"); }

  for (std::size_t i{ 0 }; i < spec.commands.size(); ++i) {
    if (spec.commands[i].run.empty()) {
      fail("IMAGE: commands[" + std::to_string(i + 1) + "] has an empty run");
    }
  }

  if (spec.tag && (spec.tag->empty() || has_whitespace(*spec.tag))) {
    fail("IMAGE: tag must be a non-empty image reference");
  }
}

std::vector<std::string> image_spec_installer_argv(image_spec const &spec) {
  constexpr std::string_view kPrefixToken{ "{prefix}" };
  std::vector<std::string> argv;
  argv.reserve(spec.installer_args.size());
  for (auto arg : spec.installer_args) {
    for (auto pos{ arg.find(kPrefixToken) }; pos != std::string::npos;
         pos = arg.find(kPrefixToken, pos)) {
      arg.replace(pos, kPrefixToken.size(), spec.installer_path.value_or(""));
      pos += spec.installer_path.value_or("").size();
    }
    argv.push_back(std::move(arg));
  }
  return argv;
}

}  // namespace provy
