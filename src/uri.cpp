#include "uri.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

namespace provy {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

std::string_view trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, to_lower, to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

// file://host/path -> //host/path, file:///path and file://localhost/path -> /path
std::string strip_file_scheme(std::string_view uri) {
  std::string cand{ uri.substr(7) };

  if (cand.size() > 1 && cand[0] == '/' && cand[1] == '/') { return cand; }

  auto const slash{ cand.find('/') };
  if (slash == std::string::npos) { return cand; }

  std::string_view const host{ std::string_view{ cand }.substr(0, slash) };
  std::string_view const tail{ std::string_view{ cand }.substr(slash) };

  if (host.empty() || iequals(host, "localhost")) { return std::string{ tail }; }
  if (host.find(':') != std::string_view::npos) { return cand; }

  return std::string{ "//" }.append(host).append(tail);
}

std::filesystem::path base_directory(std::optional<std::filesystem::path> const &root) {
  if (root && !root->empty()) { return std::filesystem::absolute(*root); }
  return std::filesystem::current_path();
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }
  if (istarts_with(canonical, "ftps://")) {
    return uri_info{ uri_scheme::FTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "ftp://")) {
    return uri_info{ uri_scheme::FTP, std::move(canonical) };
  }

  std::string local_source{};
  if (istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else {
    if (canonical.find("://") != std::string_view::npos) {
      return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
    }
    local_source = canonical;
  }

  auto const scheme{ std::filesystem::path{ local_source }.is_absolute()
                         ? uri_scheme::LOCAL_FILE_ABSOLUTE
                         : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local_source) };
}

bool uri_is_remote(uri_scheme scheme) {
  switch (scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::FTP:
    case uri_scheme::FTPS: return true;
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
    case uri_scheme::UNKNOWN: return false;
  }
  return false;
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const trimmed{ trim(local_file) };
  if (trimmed.empty()) { throw std::invalid_argument("resolve_local_uri: empty value"); }

  auto const info{ uri_classify(trimmed) };
  if (info.scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      info.scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("resolve_local_uri: value is not a local file");
  }

  if (info.canonical.empty()) {
    throw std::invalid_argument("resolve_local_uri: resolved path is empty");
  }

  std::filesystem::path resolved{ info.canonical };
  if (info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    resolved = std::filesystem::absolute(base_directory(anchor) / resolved);
  }

  return resolved.lexically_normal();
}

std::string uri_extract_filename(std::string_view uri) {
  auto const path{ strip_query_and_fragment(trim(uri)) };
  auto const slash{ path.find_last_of('/') };
  if (slash == std::string_view::npos) { return std::string{ path }; }
  return std::string{ path.substr(slash + 1) };
}

}  // namespace provy
