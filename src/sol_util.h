#pragma once

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace forcegen {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // sandboxed: base, string, table, math

namespace detail {

template <typename T>
constexpr char const *lua_type_label() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_arithmetic_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

// Field value, or nullopt when nil. Throws when present with the wrong type.
template <typename T>
std::optional<T> checked_field(sol::table const &table,
                               std::string_view key,
                               std::string_view context) {
  sol::object const obj = table[key];
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }
  if (!obj.is<T>()) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) + " must be a " +
                             lua_type_label<T>());
  }
  return obj.as<T>();
}

}  // namespace detail

template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  return detail::checked_field<T>(table, key, context);
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  if (auto value{ detail::checked_field<T>(table, key, context) }) { return *std::move(value); }
  throw std::runtime_error(std::string(context) + ": " + std::string(key) + " is required");
}

// Array of strings, e.g. arch_excludes = { "aarch64", "ppc64le" }.
std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context);

// Execute `script` in `lua`; Lua errors become std::runtime_error tagged with
// `chunk_name`.
void sol_util_run_script(sol::state &lua,
                         std::string_view script,
                         std::string const &chunk_name);

}  // namespace forcegen
