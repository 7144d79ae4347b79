#include "package_manager.h"

#include "util.h"

#include <array>
#include <cctype>
#include <utility>

namespace provy {
namespace {

constexpr std::array<std::pair<package_manager_kind, std::string_view>, 4> kManagerNames{ {
    { package_manager_kind::apt, "apt" },
    { package_manager_kind::dnf, "dnf" },
    { package_manager_kind::yum, "yum" },
    { package_manager_kind::apk, "apk" },
} };

}  // namespace

std::string_view package_manager_name(package_manager_kind kind) {
  for (auto const &[k, name] : kManagerNames) {
    if (k == kind) { return name; }
  }
  return "unknown";
}

std::optional<package_manager_kind> package_manager_parse(std::string_view name) {
  for (auto const &[k, candidate] : kManagerNames) {
    if (candidate == name) { return k; }
  }
  return std::nullopt;
}

std::string package_manager_refresh_script(package_manager_kind kind) {
  switch (kind) {
    case package_manager_kind::apt: return "apt-get update";
    case package_manager_kind::dnf: return "dnf makecache";
    case package_manager_kind::yum: return "yum makecache";
    case package_manager_kind::apk: return "apk update";
  }
  return {};
}

std::string package_manager_install_script(package_manager_kind kind,
                                           std::string_view package) {
  auto const quoted{ util_shell_quote(package) };
  switch (kind) {
    case package_manager_kind::apt:
      return "DEBIAN_FRONTEND=noninteractive apt-get install -y " + quoted;
    case package_manager_kind::dnf: return "dnf install -y " + quoted;
    case package_manager_kind::yum: return "yum install -y " + quoted;
    case package_manager_kind::apk: return "apk add --no-cache " + quoted;
  }
  return {};
}

bool package_name_is_valid(std::string_view package) {
  if (package.empty() || package.front() == '-') { return false; }
  for (char const c : package) {
    auto const uc{ static_cast<unsigned char>(c) };
    if (std::isalnum(uc)) { continue; }
    switch (c) {
      case '.':
      case '-':
      case '+':
      case '_':
      case ':':
      case '=':
      case '~':
      case '@':
      case '/': continue;
      default: return false;
    }
  }
  return true;
}

}  // namespace provy
