#include "sol_util.h"

namespace forcegen {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const arr{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!arr) { return std::nullopt; }

  std::vector<std::string> result;
  for (size_t i{ 1 }, n{ arr->size() }; i <= n; ++i) {
    sol::object const entry = (*arr)[i];
    if (!entry.is<std::string>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                               " must be an array of strings");
    }
    result.push_back(entry.as<std::string>());
  }
  return result;
}

void sol_util_run_script(sol::state &lua,
                         std::string_view script,
                         std::string const &chunk_name) {
  if (sol::protected_function_result const result{
          lua.safe_script(script, sol::script_pass_on_error, chunk_name) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to execute " + chunk_name + ": " + err.what());
  }
}

}  // namespace forcegen
