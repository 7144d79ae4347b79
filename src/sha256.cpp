#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace provy {
namespace {

using sha256_ctx_ptr_t = std::unique_ptr<mbedtls_sha256_context, decltype(&mbedtls_sha256_free)>;

sha256_ctx_ptr_t start_context(mbedtls_sha256_context &ctx) {
  mbedtls_sha256_init(&ctx);
  sha256_ctx_ptr_t scope{ &ctx, &mbedtls_sha256_free };
  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }
  return scope;
}

sha256_t finish_context(mbedtls_sha256_context &ctx) {
  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return digest;
}

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  mbedtls_sha256_context ctx;
  auto const ctx_scope{ start_context(ctx) };

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) {
      if (mbedtls_sha256_update(&ctx, buffer.data(), read_bytes)) {
        throw std::runtime_error("sha256: mbedtls_sha256_update failed");
      }
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  return finish_context(ctx);
}

sha256_t sha256_bytes(std::string_view data) {
  mbedtls_sha256_context ctx;
  auto const ctx_scope{ start_context(ctx) };

  if (mbedtls_sha256_update(&ctx,
                            reinterpret_cast<unsigned char const *>(data.data()),
                            data.size())) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }

  return finish_context(ctx);
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

bool sha256_is_valid_hex(std::string_view value) {
  if (value.size() != 64) { return false; }
  for (char const c : value) {
    if (util_hex_char_to_int(c) < 0) { return false; }
  }
  return true;
}

void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash) {
  if (expected_hex.size() != 64) {
    throw std::runtime_error(
        "sha256_verify: expected hex string must be 64 characters, got " +
        std::to_string(expected_hex.size()));
  }

  for (char const c : expected_hex) {
    if (util_hex_char_to_int(c) < 0) {
      throw std::runtime_error(std::string{ "sha256_verify: invalid hex character: " } + c);
    }
  }

  auto const expected_bytes{ util_hex_to_bytes(expected_hex) };
  if (std::memcmp(expected_bytes.data(), actual_hash.data(), actual_hash.size()) != 0) {
    throw std::runtime_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                             sha256_hex(actual_hash));
  }
}

}  // namespace provy
