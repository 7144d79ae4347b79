#include "util.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace provy {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2 != 0) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> result;
  result.reserve(hex.size() / 2);

  for (size_t i{}; i < hex.size(); i += 2) {
    int const hi{ util_hex_char_to_int(hex[i]) };
    int const lo{ util_hex_char_to_int(hex[i + 1]) };

    if (hi < 0) {
      throw std::runtime_error(
          std::string("util_hex_to_bytes: invalid character at position ") +
          std::to_string(i));
    }
    if (lo < 0) {
      throw std::runtime_error(
          std::string("util_hex_to_bytes: invalid character at position ") +
          std::to_string(i + 1));
    }

    result.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

std::string util_flatten_script_with_semicolons(std::string_view script) {
  std::string result;
  result.reserve(script.size());

  bool pending_space{ false };
  for (size_t i{ 0 }; i < script.size(); ++i) {
    char const c{ script[i] };

    if (c == '\r' || c == '\n') {
      if (c == '\r' && i + 1 < script.size() && script[i + 1] == '\n') { ++i; }
      while (!result.empty() && (result.back() == ' ' || result.back() == ';')) {
        result.pop_back();
      }
      if (!result.empty()) { result.append("; "); }
      pending_space = false;
      continue;
    }

    if (c == ' ' || c == '\t') {
      pending_space = true;
      continue;
    }

    if (pending_space && !result.empty() && result.back() != ' ') { result.push_back(' '); }
    pending_space = false;
    result.push_back(c);
  }

  while (!result.empty() && (result.back() == ' ' || result.back() == ';')) {
    result.pop_back();
  }

  return result;
}

std::string util_shell_quote(std::string_view word) {
  if (word.empty()) { return "''"; }

  bool const safe{ word.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                                          "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                          "0123456789"
                                          "@%+=:,./-_") == std::string_view::npos };
  if (safe) { return std::string{ word }; }

  std::string result;
  result.reserve(word.size() + 2);
  result.push_back('\'');
  for (char const c : word) {
    if (c == '\'') {
      result.append("'\\''");
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}

std::string util_shell_join(std::vector<std::string> const &argv) {
  std::string result;
  for (auto const &arg : argv) {
    if (!result.empty()) { result.push_back(' '); }
    result.append(util_shell_quote(arg));
  }
  return result;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view separator) {
  std::string result;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i > 0) { result.append(separator); }
    result.append(parts[i]);
  }
  return result;
}

std::filesystem::path util_make_temp_dir(std::string_view prefix) {
  std::string pattern{
    (std::filesystem::temp_directory_path() / (std::string{ prefix } + "-XXXXXX")).string()
  };

  std::vector<char> buffer{ pattern.begin(), pattern.end() };
  buffer.push_back('\0');

  if (!::mkdtemp(buffer.data())) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp failed");
  }

  return std::filesystem::path{ buffer.data() };
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace provy
