#include "libcurl_util.h"

#include <curl/curl.h>

#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace provy {

namespace {

constexpr char kDefaultUserAgent[]{ "provy-fetch/" PROVY_VERSION_STR };
constexpr long kConnectTimeoutSeconds{ 30 };

struct write_state {
  std::ofstream *stream;
  std::uint64_t bytes{ 0 };
};

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *state{ static_cast<write_state *>(userdata) };
  size_t const total{ size * nmemb };
  state->stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*state->stream) { return 0; }
  state->bytes += total;
  return total;
}

int curl_xferinfo(void *userdata,
                  curl_off_t dltotal,
                  curl_off_t dlnow,
                  curl_off_t /*ultotal*/,
                  curl_off_t /*ulnow*/) {
  auto const *progress{ static_cast<fetch_progress_cb_t const *>(userdata) };
  fetch_transfer_progress const value{
    .transferred = static_cast<std::uint64_t>(dlnow),
    .total = dltotal > 0 ? std::optional<std::uint64_t>{ static_cast<std::uint64_t>(dltotal) }
                         : std::nullopt,
  };
  return (*progress)(value) ? 0 : 1;
}

bool is_http_scheme(char const *scheme) {
  if (!scheme) { return false; }
  std::string lowered{ scheme };
  for (auto &c : lowered) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return lowered == "http" || lowered == "https";
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

libcurl_download_result libcurl_download(std::string_view url,
                                         std::filesystem::path const &destination,
                                         fetch_progress_cb_t const &progress) {
  libcurl_ensure_initialized();

  std::string const url_copy{ url };

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::filesystem::path resolved_destination{ destination };
  if (!resolved_destination.is_absolute()) {
    resolved_destination = std::filesystem::absolute(resolved_destination);
  }
  resolved_destination = resolved_destination.lexically_normal();

  std::error_code ec;
  auto const parent{ resolved_destination.parent_path() };
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("libcurl_download: failed to create parent directory: " +
                               parent.string() + ": " + ec.message());
    }
  }

  std::ofstream output{ resolved_destination, std::ios::binary | std::ios::trunc };
  if (!output.is_open()) {
    throw std::runtime_error("libcurl_download: failed to open destination: " +
                             resolved_destination.string());
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  write_state state{ .stream = &output };
  char error_buffer[CURL_ERROR_SIZE]{};

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_FAILONERROR, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_ERRORBUFFER, error_buffer);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
  setopt(CURLOPT_WRITEDATA, &state);
  if (progress) {
    setopt(CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
    setopt(CURLOPT_XFERINFODATA, const_cast<fetch_progress_cb_t *>(&progress));
    setopt(CURLOPT_NOPROGRESS, 0L);
  } else {
    setopt(CURLOPT_NOPROGRESS, 1L);
  }

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    output.close();
    std::filesystem::remove(resolved_destination, ec);
    std::string message{ "curl_easy_perform failed: " };
    message += error_buffer[0] ? error_buffer : curl_easy_strerror(perform_result);
    throw std::runtime_error(message);
  }

  // FAILONERROR only covers >= 400; an unfollowed 3xx or a 1xx leaves a non-payload body.
  char *scheme{ nullptr };
  long status{ 0 };
  if (curl_easy_getinfo(handle.get(), CURLINFO_SCHEME, &scheme) == CURLE_OK &&
      is_http_scheme(scheme) &&
      curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status) == CURLE_OK &&
      (status < 200 || status >= 300)) {
    output.close();
    std::filesystem::remove(resolved_destination, ec);
    throw std::runtime_error("libcurl_download: unexpected HTTP status " +
                             std::to_string(status) + " for " + url_copy);
  }

  output.flush();
  if (!output) {
    output.close();
    std::filesystem::remove(resolved_destination, ec);
    throw std::runtime_error("libcurl_download: failed to flush destination file");
  }
  output.close();

  return { .destination = resolved_destination, .bytes = state.bytes };
}

std::string libcurl_version() {
  auto const *info{ curl_version_info(CURLVERSION_NOW) };
  return info && info->version ? info->version : "unknown";
}

}  // namespace provy
