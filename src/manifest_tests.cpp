#include "manifest.h"

#include "provision_error.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

namespace fs = std::filesystem;

struct scoped_chdir {
  fs::path original;

  explicit scoped_chdir(fs::path const &target) : original(fs::current_path()) {
    fs::current_path(target);
  }

  ~scoped_chdir() { fs::current_path(original); }
};

constexpr char kMinimalManifest[]{ R"lua(IMAGE = { base_image = "ubuntu:14.04" })lua" };

void write_file(fs::path const &path, std::string_view content) {
  fs::create_directories(path.parent_path());
  std::ofstream out{ path, std::ios::binary };
  out << content;
}

}  // namespace

TEST_CASE("parse_provy_meta reads header directives") {
  auto const meta{ provy::parse_provy_meta(R"(-- @provy engine "podman"
--   @provy tag "example/conda:latest"
-- @provy unknown "ignored"
-- @provyengine "nope"
-- not a directive
IMAGE = {}
)") };
  CHECK(meta.engine == "podman");
  CHECK(meta.tag == "example/conda:latest");
}

TEST_CASE("parse_provy_meta handles escapes and malformed lines") {
  auto const meta{ provy::parse_provy_meta("-- @provy tag \"a\\\"b\"\n-- @provy engine \"docker") };
  CHECK(meta.tag == "a\"b");
  CHECK_FALSE(meta.engine.has_value());
}

TEST_CASE("manifest::discover finds provy.lua in current directory") {
  auto const root{ provy::util_make_temp_dir("provy-manifest-test") };
  provy::scoped_path_cleanup const cleanup{ root };
  fs::create_directories(root / "repo" / ".git");
  write_file(root / "repo" / "provy.lua", kMinimalManifest);

  scoped_chdir const cd{ root / "repo" };
  auto const result{ provy::manifest::discover() };

  REQUIRE(result.has_value());
  CHECK(result->filename() == "provy.lua");
  CHECK(fs::equivalent(result->parent_path(), root / "repo"));
}

TEST_CASE("manifest::discover searches upward from subdirectory") {
  auto const root{ provy::util_make_temp_dir("provy-manifest-test") };
  provy::scoped_path_cleanup const cleanup{ root };
  fs::create_directories(root / "repo" / ".git");
  fs::create_directories(root / "repo" / "a" / "b");
  write_file(root / "repo" / "provy.lua", kMinimalManifest);

  scoped_chdir const cd{ root / "repo" / "a" / "b" };
  auto const result{ provy::manifest::discover() };

  REQUIRE(result.has_value());
  CHECK(fs::equivalent(result->parent_path(), root / "repo"));
}

TEST_CASE("manifest::discover stops at .git directory boundary") {
  auto const root{ provy::util_make_temp_dir("provy-manifest-test") };
  provy::scoped_path_cleanup const cleanup{ root };
  write_file(root / "provy.lua", kMinimalManifest);
  fs::create_directories(root / "inner" / ".git");

  scoped_chdir const cd{ root / "inner" };
  CHECK_FALSE(provy::manifest::discover().has_value());
}

TEST_CASE("manifest::find_manifest_path") {
  auto const root{ provy::util_make_temp_dir("provy-manifest-test") };
  provy::scoped_path_cleanup const cleanup{ root };
  write_file(root / "custom.lua", kMinimalManifest);

  CHECK(provy::manifest::find_manifest_path(root / "custom.lua") == root / "custom.lua");
  CHECK_THROWS_WITH_AS(provy::manifest::find_manifest_path(root / "missing.lua"),
                       doctest::Contains("manifest not found"),
                       std::runtime_error);
}

TEST_CASE("manifest::load reads IMAGE and directives") {
  auto const m{ provy::manifest::load(R"lua(-- @provy engine "podman"
-- @provy tag "example/runtime:1"
local prefix = "/opt/runtime"
IMAGE = {
  base_image = "ubuntu:14.04",
  packages = { "wget", "git" },
  installer_url = "https://example/installer.sh",
  installer_path = prefix,
  path_prepend = { prefix .. "/bin" },
  path_env_base = "/usr/bin:/bin",
}
)lua",
                                      "/work/provy.lua") };

  CHECK(m->manifest_path == "/work/provy.lua");
  CHECK(m->root() == "/work");
  CHECK(m->meta.engine == "podman");
  CHECK(m->image.tag == "example/runtime:1");
  CHECK(m->image.installer_path == "/opt/runtime");
  CHECK(m->image.path_prepend == std::vector<std::string>{ "/opt/runtime/bin" });
}

TEST_CASE("manifest::load prefers IMAGE.tag over the tag directive") {
  auto const m{ provy::manifest::load(R"lua(-- @provy tag "from-directive"
IMAGE = { base_image = "ubuntu:14.04", tag = "from-table" })lua",
                                      "/work/provy.lua") };
  CHECK(m->image.tag == "from-table");
}

TEST_CASE("manifest::load reports missing IMAGE as a manifest error") {
  try {
    provy::manifest::load("PACKAGES = {}", "/work/provy.lua");
    FAIL("expected manifest error");
  } catch (provy::provision_error const &e) {
    CHECK(e.kind() == provy::provision_error_kind::manifest);
    CHECK(std::string{ e.what() }.find("'IMAGE'") != std::string::npos);
  }
}

TEST_CASE("manifest::load reports Lua errors as manifest errors") {
  CHECK_THROWS_WITH_AS(provy::manifest::load("IMAGE = {", "/work/provy.lua"),
                       doctest::Contains("Failed to execute manifest script"),
                       provy::provision_error);
  CHECK_THROWS_WITH_AS(provy::manifest::load("error('boom')", "/work/provy.lua"),
                       doctest::Contains("boom"),
                       provy::provision_error);
}

TEST_CASE("manifest::load from file") {
  auto const root{ provy::util_make_temp_dir("provy-manifest-test") };
  provy::scoped_path_cleanup const cleanup{ root };
  write_file(root / "provy.lua", kMinimalManifest);

  auto const m{ provy::manifest::load(root / "provy.lua") };
  CHECK(m->image.base_image == "ubuntu:14.04");
}

TEST_CASE("bundled conda-base manifest plans cleanly") {
  auto const m{ provy::manifest::load(std::filesystem::path{ PROVY_SOURCE_DIR } /
                                      "manifests" / "conda-base.lua") };
  CHECK(m->meta.engine == "docker");
  CHECK(m->image.tag == "provy/conda-base:latest");
  CHECK(m->image.packages.size() == 12);
  CHECK(m->image.installer_path == "/anaconda");
  CHECK(m->image.path_prepend.back() == "/anaconda/bin");
  CHECK(m->image.self_update == "conda update -y conda");
}
