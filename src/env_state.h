#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace provy {

inline constexpr char kDefaultPath[]{
  "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin"
};

// join(prepend, ":") + ":" + base. An empty prepend yields base unchanged; an empty
// base yields the joined prepend without a trailing separator.
std::string path_prepend(std::vector<std::string> const &prepend, std::string_view base);

// Immutable, name-ordered environment. Every "mutation" returns a new value.
class env_state {
 public:
  using map_t = std::map<std::string, std::string, std::less<>>;
  using change_t = std::pair<std::string, std::string>;

  env_state() = default;
  explicit env_state(map_t vars);

  // Parses NAME=VALUE lines; lines without '=' or with an empty name are skipped.
  static env_state from_lines(std::vector<std::string> const &lines);

  std::optional<std::string> get(std::string_view name) const;
  bool contains(std::string_view name) const;
  std::size_t size() const { return vars_.size(); }
  map_t const &vars() const { return vars_; }

  env_state with(std::string name, std::string value) const;
  env_state with_all(std::map<std::string, std::string> const &overrides) const;

  // PATH becomes path_prepend(prepend, base).
  env_state with_path_prepended(std::vector<std::string> const &prepend,
                                std::string_view base) const;

  // Variables added or changed relative to base, in name order. Removals are not
  // representable in an image's default environment and are ignored.
  std::vector<change_t> diff(env_state const &base) const;

  bool operator==(env_state const &) const = default;

 private:
  map_t vars_;
};

}  // namespace provy
