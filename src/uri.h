#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace provy {

enum class uri_scheme { HTTP, HTTPS, FTP, FTPS, LOCAL_FILE_ABSOLUTE, LOCAL_FILE_RELATIVE, UNKNOWN };

struct uri_info {
  uri_scheme scheme;
  std::string canonical;
};

uri_info uri_classify(std::string_view value);

bool uri_is_remote(uri_scheme scheme);

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Filename component of a URI: everything after the last '/' with any query or
// fragment removed. Empty if the URI ends in '/'.
std::string uri_extract_filename(std::string_view uri);

}  // namespace provy
