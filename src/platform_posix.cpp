#include "platform.h"

#include <unistd.h>
#include <wordexp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace provy::platform {

std::filesystem::path get_exe_path() {
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
}

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty()) { return {}; }

  wordexp_t we{};
  std::string const path_str{ p };
  int const flags{ WRDE_NOCMD | WRDE_UNDEF };  // no $(cmd), fail on undefined $VAR

  int const rc{ wordexp(path_str.c_str(), &we, flags) };

  if (rc == 0) {
    if (we.we_wordc == 0) {
      wordfree(&we);
      throw std::runtime_error("path expansion produced no results: " + path_str);
    }
    std::filesystem::path result{ we.we_wordv[0] };
    wordfree(&we);
    return result;
  }

  // POSIX: wordfree() must only be called after successful wordexp()
  if (rc == WRDE_BADVAL) {
    throw std::runtime_error("undefined variable in path: " + path_str);
  }
  throw std::runtime_error("path expansion failed: " + path_str);
}

std::optional<std::string> env_var_get(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_get: null name"); }
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

}  // namespace provy::platform
