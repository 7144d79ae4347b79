#pragma once

#include "sol/sol.hpp"

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace provy {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // with std libs

namespace detail {

template <typename T>
constexpr std::string_view type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

inline std::runtime_error field_error(std::string_view context,
                                      std::string_view key,
                                      std::string_view problem) {
  return std::runtime_error(std::string(context) + ": " + std::string(key) + " " +
                            std::string(problem));
}

}  // namespace detail

template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) {
    return std::nullopt;
  }

  // strings must not silently accept numbers
  bool const type_ok{ [&] {
    if constexpr (std::is_same_v<T, std::string>) {
      return obj->get_type() == sol::type::string;
    } else {
      return obj->is<T>();
    }
  }() };

  if (!type_ok) {
    throw detail::field_error(context,
                              key,
                              "must be a " + std::string(detail::type_name_for_error<T>()));
  }

  return obj->as<T>();
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  auto value{ sol_util_get_optional<T>(table, key, context) };
  if (!value) { throw detail::field_error(context, key, "is required"); }
  return std::move(*value);
}

template <typename T>
T sol_util_get_or_default(sol::table const &table,
                          std::string_view key,
                          T const &default_value,
                          std::string_view context) {
  auto opt{ sol_util_get_optional<T>(table, key, context) };
  return opt.value_or(default_value);
}

// Array-style table of strings (1..n, no holes). Absent key yields nullopt.
std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context);

// Table of string keys to string values, ordered by key. Absent key yields nullopt.
std::optional<std::map<std::string, std::string>> sol_util_get_string_map(
    sol::table const &table,
    std::string_view key,
    std::string_view context);

}  // namespace provy
