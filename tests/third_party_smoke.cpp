#include "CLI/CLI.hpp"
#include "sol/sol.hpp"

#include <string>
#include <vector>

int main() {
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string);
    auto result = lua.safe_script("return string.format('%s-%d', 'ok', 7)", sol::script_pass_on_error);
    if (!result.valid()) {
        return 1;
    }
    std::string const formatted = result;
    if (formatted != "ok-7") {
        return 1;
    }

    lua_State *L = lua.lua_state();
    if (!L || lua_gettop(L) < 0) {
        return 1;
    }

    CLI::App app{"smoke"};
    bool flag{false};
    app.add_flag("--flag", flag, "test flag");
    std::vector<std::string> args{"--flag"};
    try {
        app.parse(args);
    } catch (CLI::ParseError const &) {
        return 1;
    }
    if (!flag) {
        return 1;
    }

    return 0;
}
