#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace provy {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256_bytes(std::string_view data);

std::string sha256_hex(sha256_t const &digest);

// Throws std::runtime_error if expected_hex is malformed or does not match
// (comparison is case-insensitive).
void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash);

// True for a 64-character hex string.
bool sha256_is_valid_hex(std::string_view value);

}  // namespace provy
