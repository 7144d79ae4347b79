#pragma once

#include "fetch_progress.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace provy {

void libcurl_ensure_initialized();

struct libcurl_download_result {
  std::filesystem::path destination;
  std::uint64_t bytes{ 0 };
};

libcurl_download_result libcurl_download(std::string_view url,
                                         std::filesystem::path const &destination,
                                         fetch_progress_cb_t const &progress = {});

std::string libcurl_version();

}  // namespace provy
