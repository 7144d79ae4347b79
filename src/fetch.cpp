#include "fetch.h"

#include "libcurl_util.h"
#include "util.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace provy {
namespace {

std::filesystem::path prepare_destination(std::filesystem::path destination) {
  if (destination.empty()) {
    throw std::invalid_argument("fetch: destination path is empty");
  }

  if (!destination.is_absolute()) { destination = std::filesystem::absolute(destination); }
  destination = destination.lexically_normal();

  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("fetch: failed to create destination parent: " +
                               parent.string() + ": " + ec.message());
    }
  }

  return destination;
}

fetch_result fetch_local_file(std::string const &local_file,
                              std::filesystem::path const &destination,
                              std::optional<std::filesystem::path> const &file_root) {
  auto const source{ uri_resolve_local_file_relative(local_file, file_root) };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    throw std::runtime_error("fetch: source file does not exist: " + source.string());
  }

  auto const dest{ prepare_destination(destination) };

  std::filesystem::copy_file(source,
                             dest,
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error("fetch: failed to copy file: " + source.string() + " -> " +
                             dest.string() + ": " + ec.message());
  }

  auto const size{ std::filesystem::file_size(dest, ec) };
  return fetch_result{ .scheme = uri_scheme::LOCAL_FILE_ABSOLUTE,
                       .resolved_source = source,
                       .resolved_destination = dest,
                       .bytes = ec ? 0 : static_cast<std::uint64_t>(size) };
}

}  // namespace

fetch_request fetch_request_from_source(std::string source,
                                        std::filesystem::path destination,
                                        std::optional<std::filesystem::path> file_root) {
  auto const info{ uri_classify(source) };
  switch (info.scheme) {
    case uri_scheme::HTTP:
      return fetch_request_http{ .source = info.canonical, .destination = destination };
    case uri_scheme::HTTPS:
      return fetch_request_https{ .source = info.canonical, .destination = destination };
    case uri_scheme::FTP:
      return fetch_request_ftp{ .source = info.canonical, .destination = destination };
    case uri_scheme::FTPS:
      return fetch_request_ftps{ .source = info.canonical, .destination = destination };
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return fetch_request_file{ .source = std::move(source),
                                 .destination = destination,
                                 .file_root = std::move(file_root) };
    case uri_scheme::UNKNOWN: break;
  }

  if (info.canonical.empty()) { throw std::invalid_argument("fetch: source URI is empty"); }
  throw std::invalid_argument("fetch: unsupported source: " + info.canonical);
}

fetch_result fetch(fetch_request const &request) {
  // HTTP/HTTPS/FTP/FTPS all go through libcurl
  auto const fetch_via_curl = [](auto const &req) -> fetch_result {
    auto const info{ uri_classify(req.source) };
    if (!uri_is_remote(info.scheme)) {
      throw std::invalid_argument("fetch: not a remote source: " + info.canonical);
    }
    auto const downloaded{ libcurl_download(info.canonical,
                                            prepare_destination(req.destination),
                                            req.progress) };
    return fetch_result{ .scheme = info.scheme,
                         .resolved_source = std::filesystem::path{ info.canonical },
                         .resolved_destination = downloaded.destination,
                         .bytes = downloaded.bytes };
  };

  return std::visit(
      match{
          [&](fetch_request_http const &req) { return fetch_via_curl(req); },
          [&](fetch_request_https const &req) { return fetch_via_curl(req); },
          [&](fetch_request_ftp const &req) { return fetch_via_curl(req); },
          [&](fetch_request_ftps const &req) { return fetch_via_curl(req); },
          [](fetch_request_file const &req) -> fetch_result {
            if (uri_classify(req.source).canonical.empty()) {
              throw std::invalid_argument("fetch: source URI is empty");
            }
            return fetch_local_file(req.source, req.destination, req.file_root);
          },
      },
      request);
}

}  // namespace provy
