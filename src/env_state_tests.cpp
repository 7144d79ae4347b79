#include "env_state.h"

#include "doctest.h"

#include <string>
#include <vector>

TEST_CASE("path_prepend joins prepends ahead of base") {
  CHECK(provy::path_prepend({ "/opt/runtime/bin" }, "/usr/bin:/bin") ==
        "/opt/runtime/bin:/usr/bin:/bin");
  CHECK(provy::path_prepend({ "/opt/rh/devtoolset-2/root/usr/bin",
                              "/opt/rh/autotools-latest/root/usr/bin",
                              "/anaconda/bin" },
                            "/usr/bin") ==
        "/opt/rh/devtoolset-2/root/usr/bin:/opt/rh/autotools-latest/root/usr/bin:"
        "/anaconda/bin:/usr/bin");
}

TEST_CASE("path_prepend edge cases") {
  CHECK(provy::path_prepend({}, "/usr/bin:/bin") == "/usr/bin:/bin");
  CHECK(provy::path_prepend({}, "") == "");
  CHECK(provy::path_prepend({ "/a", "/b" }, "") == "/a:/b");
}

TEST_CASE("env_state is immutable under with") {
  provy::env_state const base{ { { "PATH", "/usr/bin:/bin" }, { "HOME", "/root" } } };
  auto const next{ base.with("PATH", "/opt/bin:/usr/bin:/bin") };

  CHECK(base.get("PATH") == "/usr/bin:/bin");
  CHECK(next.get("PATH") == "/opt/bin:/usr/bin:/bin");
  CHECK(next.get("HOME") == "/root");
  CHECK_FALSE(next.get("MISSING").has_value());
  CHECK(next.contains("HOME"));
}

TEST_CASE("env_state with_path_prepended rewrites PATH only") {
  provy::env_state const base{ { { "PATH", "/usr/bin:/bin" }, { "LANG", "C" } } };
  auto const next{ base.with_path_prepended({ "/opt/runtime/bin" }, "/usr/bin:/bin") };
  CHECK(next.get("PATH") == "/opt/runtime/bin:/usr/bin:/bin");
  CHECK(next.get("LANG") == "C");
  CHECK(next.size() == 2);
}

TEST_CASE("env_state with_all applies overrides") {
  provy::env_state const base{ { { "LANG", "C" } } };
  auto const next{ base.with_all({ { "LANG", "C.UTF-8" }, { "CONDA_DIR", "/anaconda" } }) };
  CHECK(next.get("LANG") == "C.UTF-8");
  CHECK(next.get("CONDA_DIR") == "/anaconda");
  CHECK(base.get("LANG") == "C");
}

TEST_CASE("env_state from_lines parses NAME=VALUE") {
  auto const env{ provy::env_state::from_lines({ "PATH=/usr/bin:/bin",
                                                 "EMPTY=",
                                                 "EQ=a=b",
                                                 "garbage",
                                                 "=nameless" }) };
  CHECK(env.size() == 3);
  CHECK(env.get("PATH") == "/usr/bin:/bin");
  CHECK(env.get("EMPTY") == "");
  CHECK(env.get("EQ") == "a=b");
}

TEST_CASE("env_state diff reports additions and changes in name order") {
  provy::env_state const base{ { { "PATH", "/usr/bin" }, { "HOME", "/root" } } };
  auto const final_env{
    base.with("PATH", "/opt/bin:/usr/bin").with("CONDA_DIR", "/anaconda")
  };

  auto const changes{ final_env.diff(base) };
  REQUIRE(changes.size() == 2);
  CHECK(changes[0] == provy::env_state::change_t{ "CONDA_DIR", "/anaconda" });
  CHECK(changes[1] == provy::env_state::change_t{ "PATH", "/opt/bin:/usr/bin" });
  CHECK(base.diff(base).empty());
}

TEST_CASE("env_state from_lines and equality") {
  provy::env_state const env{ { { "B", "2" }, { "A", "1" } } };
  CHECK(provy::env_state::from_lines({ "A=1", "B=2" }) == env);
  CHECK_FALSE(provy::env_state::from_lines({ "A=1" }) == env);
}
