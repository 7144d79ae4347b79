#pragma once

#include "fetch_progress.h"
#include "uri.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace provy {

struct fetch_request_http {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

struct fetch_request_https {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

struct fetch_request_ftp {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

struct fetch_request_ftps {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

// Local file fetch; relative sources resolve against file_root
struct fetch_request_file {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
  std::optional<std::filesystem::path> file_root{};
};

using fetch_request = std::variant<fetch_request_http,
                                   fetch_request_https,
                                   fetch_request_ftp,
                                   fetch_request_ftps,
                                   fetch_request_file>;

struct fetch_result {
  uri_scheme scheme;
  std::filesystem::path resolved_source;
  std::filesystem::path resolved_destination;
  std::uint64_t bytes{ 0 };
};

// Picks the request type from the source's scheme. Throws std::invalid_argument on an
// empty or unsupported source.
fetch_request fetch_request_from_source(std::string source,
                                        std::filesystem::path destination,
                                        std::optional<std::filesystem::path> file_root = {});

// Throws std::runtime_error on transfer failure; a partial destination is removed.
fetch_result fetch(fetch_request const &request);

}  // namespace provy
