#include "sol_util.h"

#include "doctest.h"

#include <stdexcept>

TEST_CASE("sol_util_make_lua_state creates state with standard libraries") {
  auto lua{ provy::sol_util_make_lua_state() };
  REQUIRE(lua);

  lua->script("x = 10 + 20");
  int const x = (*lua)["x"];
  CHECK(x == 30);

  lua->script("z = string.upper('hello') .. table.concat({'a', 'b'}, ':')");
  std::string const z = (*lua)["z"];
  CHECK(z == "HELLOa:b");
}

TEST_CASE("sol_util_make_lua_state overrides error to include stack trace") {
  auto lua{ provy::sol_util_make_lua_state() };

  auto const result = lua->safe_script(R"lua(
    function foo()
      error("test error")
    end
    foo()
  )lua",
                                       sol::script_pass_on_error);

  CHECK_FALSE(result.valid());
  sol::error const err = result;
  std::string const msg{ err.what() };
  CHECK(msg.find("test error") != std::string::npos);
  CHECK(msg.find("stack traceback:") != std::string::npos);
}

TEST_CASE("sol_util_get_optional returns value when present and correct type") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {flag = true, name = 'test', count = 42}");
  sol::table t = (*lua)["t"];

  CHECK(provy::sol_util_get_optional<bool>(t, "flag", "test") == true);
  CHECK(provy::sol_util_get_optional<std::string>(t, "name", "test") == "test");
  CHECK(provy::sol_util_get_optional<int>(t, "count", "test") == 42);
}

TEST_CASE("sol_util_get_optional returns nullopt when absent or nil") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {x = nil}");
  sol::table t = (*lua)["t"];

  CHECK_FALSE(provy::sol_util_get_optional<bool>(t, "missing", "test").has_value());
  CHECK_FALSE(provy::sol_util_get_optional<bool>(t, "x", "test").has_value());
}

TEST_CASE("sol_util_get_optional throws when wrong type") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {flag = 'not a boolean', name = 123, count = true, nested = 'x'}");
  sol::table t = (*lua)["t"];

  CHECK_THROWS_WITH_AS(provy::sol_util_get_optional<bool>(t, "flag", "IMAGE"),
                       "IMAGE: flag must be a boolean",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_optional<std::string>(t, "name", "IMAGE"),
                       "IMAGE: name must be a string",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_optional<int>(t, "count", "IMAGE"),
                       "IMAGE: count must be a number",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_optional<sol::table>(t, "nested", "IMAGE"),
                       "IMAGE: nested must be a table",
                       std::runtime_error);
}

TEST_CASE("sol_util_get_required") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {base = 'ubuntu:14.04', flag = 'no'}");
  sol::table t = (*lua)["t"];

  CHECK(provy::sol_util_get_required<std::string>(t, "base", "IMAGE") == "ubuntu:14.04");
  CHECK_THROWS_WITH_AS(provy::sol_util_get_required<std::string>(t, "missing", "IMAGE"),
                       "IMAGE: missing is required",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_required<bool>(t, "flag", "IMAGE"),
                       "IMAGE: flag must be a boolean",
                       std::runtime_error);
}

TEST_CASE("sol_util_get_or_default") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {shell = 'sh'}");
  sol::table t = (*lua)["t"];

  CHECK(provy::sol_util_get_or_default<std::string>(t, "shell", "bash", "IMAGE") == "sh");
  CHECK(provy::sol_util_get_or_default<std::string>(t, "missing", "bash", "IMAGE") ==
        "bash");
  CHECK(provy::sol_util_get_or_default<bool>(t, "fatal", true, "IMAGE") == true);
}

TEST_CASE("sol_util_get_string_array reads ordered string lists") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {packages = {'wget', 'git'}, empty = {}}");
  sol::table t = (*lua)["t"];

  auto const packages{ provy::sol_util_get_string_array(t, "packages", "IMAGE") };
  REQUIRE(packages.has_value());
  CHECK(*packages == std::vector<std::string>{ "wget", "git" });

  auto const empty{ provy::sol_util_get_string_array(t, "empty", "IMAGE") };
  REQUIRE(empty.has_value());
  CHECK(empty->empty());

  CHECK_FALSE(provy::sol_util_get_string_array(t, "missing", "IMAGE").has_value());
}

TEST_CASE("sol_util_get_string_array rejects non-string entries and maps") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {mixed = {'wget', 42}, keyed = {a = 'x'}, scalar = 'wget'}");
  sol::table t = (*lua)["t"];

  CHECK_THROWS_WITH_AS(provy::sol_util_get_string_array(t, "mixed", "IMAGE"),
                       "IMAGE: mixed entry 2 must be a string",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_string_array(t, "keyed", "IMAGE"),
                       "IMAGE: keyed must be an array of strings",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(provy::sol_util_get_string_array(t, "scalar", "IMAGE"),
                       "IMAGE: scalar must be a table",
                       std::runtime_error);
}

TEST_CASE("sol_util_get_string_map reads key-ordered maps") {
  auto lua{ provy::sol_util_make_lua_state() };
  lua->script("t = {env = {LANG = 'C.UTF-8', CONDA_DIR = '/anaconda'}, bad = {X = 1}}");
  sol::table t = (*lua)["t"];

  auto const env{ provy::sol_util_get_string_map(t, "env", "IMAGE") };
  REQUIRE(env.has_value());
  REQUIRE(env->size() == 2);
  CHECK(env->begin()->first == "CONDA_DIR");
  CHECK(env->at("LANG") == "C.UTF-8");

  CHECK_THROWS_WITH_AS(provy::sol_util_get_string_map(t, "bad", "IMAGE"),
                       "IMAGE: bad value for 'X' must be a string",
                       std::runtime_error);
}

TEST_CASE("type_name_for_error returns correct names") {
  CHECK(provy::detail::type_name_for_error<bool>() == "boolean");
  CHECK(provy::detail::type_name_for_error<std::string>() == "string");
  CHECK(provy::detail::type_name_for_error<sol::table>() == "table");
  CHECK(provy::detail::type_name_for_error<int>() == "number");
  CHECK(provy::detail::type_name_for_error<double>() == "number");
}
