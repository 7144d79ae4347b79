#include "util.h"

#include "doctest.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("provy-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

void write_dummy_file(std::filesystem::path const &path) {
  std::ofstream out{ path };
  out << "provy-test";
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto result1{ std::visit(
      provy::match{ [](int x) { return x * 2; },
                    [](std::string const &s) { return static_cast<int>(s.size()); } },
      v1) };

  auto result2{ std::visit(
      provy::match{ [](int x) { return x * 2; },
                    [](std::string const &s) { return static_cast<int>(s.size()); } },
      v2) };

  CHECK(result1 == 84);
  CHECK(result2 == 5);
}

TEST_CASE("util_bytes_to_hex and util_hex_to_bytes") {
  std::vector<unsigned char> const bytes{ 0x00, 0x7f, 0xab, 0xff };
  auto const hex{ provy::util_bytes_to_hex(bytes.data(), bytes.size()) };
  CHECK(hex == "007fabff");
  CHECK(provy::util_hex_to_bytes("007FABff") == bytes);
}

TEST_CASE("util_hex_to_bytes rejects odd length and bad characters") {
  CHECK_THROWS_WITH(provy::util_hex_to_bytes("abc"),
                    "util_hex_to_bytes: hex string must have even length, got 3");
  CHECK_THROWS_WITH(provy::util_hex_to_bytes("zz"),
                    "util_hex_to_bytes: invalid character at position 0");
  CHECK_THROWS_WITH(provy::util_hex_to_bytes("0z"),
                    "util_hex_to_bytes: invalid character at position 1");
}

TEST_CASE("util_load_file reads contents") {
  auto const path{ make_temp_path("load") };
  write_dummy_file(path);
  provy::scoped_path_cleanup cleanup{ path };

  auto const bytes{ provy::util_load_file(path) };
  CHECK(std::string(bytes.begin(), bytes.end()) == "provy-test");
}

TEST_CASE("util_load_file throws for missing file") {
  CHECK_THROWS_AS(provy::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_format_bytes") {
  CHECK(provy::util_format_bytes(0) == "0B");
  CHECK(provy::util_format_bytes(1023) == "1023B");
  CHECK(provy::util_format_bytes(1536) == "1.50KB");
  CHECK(provy::util_format_bytes(std::uint64_t{ 5 } * 1024 * 1024) == "5.00MB");
}

TEST_CASE("util_flatten_script_with_semicolons") {
  CHECK(provy::util_flatten_script_with_semicolons("cmd1\ncmd2\ncmd3") ==
        "cmd1; cmd2; cmd3");
  CHECK(provy::util_flatten_script_with_semicolons("  a   b\r\n\n c;\n") == "a b; c");
  CHECK(provy::util_flatten_script_with_semicolons("") == "");
}

TEST_CASE("util_shell_quote leaves safe words alone") {
  CHECK(provy::util_shell_quote("build-essential") == "build-essential");
  CHECK(provy::util_shell_quote("/opt/runtime/bin:/usr/bin") == "/opt/runtime/bin:/usr/bin");
  CHECK(provy::util_shell_quote("PATH=/a:/b") == "PATH=/a:/b");
}

TEST_CASE("util_shell_quote wraps unsafe words") {
  CHECK(provy::util_shell_quote("") == "''");
  CHECK(provy::util_shell_quote("a b") == "'a b'");
  CHECK(provy::util_shell_quote("$HOME") == "'$HOME'");
  CHECK(provy::util_shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("util_shell_join") {
  CHECK(provy::util_shell_join({ "docker", "exec", "-e", "A=b c", "box" }) ==
        "docker exec -e 'A=b c' box");
  CHECK(provy::util_shell_join({}) == "");
}

TEST_CASE("util_join") {
  CHECK(provy::util_join({ "a", "b", "c" }, ":") == "a:b:c");
  CHECK(provy::util_join({ "solo" }, ":") == "solo");
  CHECK(provy::util_join({}, ":") == "");
}

TEST_CASE("util_make_temp_dir creates unique directories") {
  auto const a{ provy::util_make_temp_dir("provy-util-test") };
  auto const b{ provy::util_make_temp_dir("provy-util-test") };
  provy::scoped_path_cleanup cleanup_a{ a };
  provy::scoped_path_cleanup cleanup_b{ b };

  CHECK(a != b);
  CHECK(std::filesystem::is_directory(a));
  CHECK(std::filesystem::is_directory(b));
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto const dir{ make_temp_path("tree") };
  std::filesystem::create_directories(dir / "nested");
  write_dummy_file(dir / "nested" / "file.txt");

  {
    provy::scoped_path_cleanup cleanup{ dir };
    CHECK(std::filesystem::exists(dir));
  }

  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup reset swaps target") {
  auto const first{ make_temp_path("first") };
  auto const second{ make_temp_path("second") };
  write_dummy_file(first);
  write_dummy_file(second);

  {
    provy::scoped_path_cleanup cleanup{ first };
    cleanup.reset(second);
    CHECK_FALSE(std::filesystem::exists(first));
    CHECK(std::filesystem::exists(second));
  }

  CHECK_FALSE(std::filesystem::exists(second));
}
