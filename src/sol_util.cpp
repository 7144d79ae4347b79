#include "sol_util.h"

namespace provy {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug);

  // error() and assert() carry a stack trace so manifest mistakes point at a line
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const list{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!list) { return std::nullopt; }

  std::vector<std::string> result;
  std::size_t const count{ list->size() };
  result.reserve(count);

  std::size_t entries{ 0 };
  for (auto const &[k, v] : *list) {
    (void)k;
    (void)v;
    ++entries;
  }
  if (entries != count) {
    throw detail::field_error(context, key, "must be an array of strings");
  }

  for (std::size_t i{ 1 }; i <= count; ++i) {
    sol::object const item{ (*list)[i] };
    if (item.get_type() != sol::type::string) {
      throw detail::field_error(context,
                                key,
                                "entry " + std::to_string(i) + " must be a string");
    }
    result.push_back(item.as<std::string>());
  }

  return result;
}

std::optional<std::map<std::string, std::string>> sol_util_get_string_map(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const map{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!map) { return std::nullopt; }

  std::map<std::string, std::string> result;
  for (auto const &[k, v] : *map) {
    if (k.get_type() != sol::type::string) {
      throw detail::field_error(context, key, "keys must be strings");
    }
    if (v.get_type() != sol::type::string) {
      throw detail::field_error(context,
                                key,
                                "value for '" + k.as<std::string>() + "' must be a string");
    }
    result.emplace(k.as<std::string>(), v.as<std::string>());
  }

  return result;
}

}  // namespace provy
