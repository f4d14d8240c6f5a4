#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace forcegen {

// A command's relationship to the --force workaround. Declaration order is the
// enumeration order of generated tests.
enum class need : int {
  unneeded_fail = 0,  // fails with or without --force
  unneeded_win = 1,   // succeeds with or without --force
  fake_needed = 2,    // looks like it needs --force but does not
  needed = 3,         // succeeds only with --force
};

constexpr int need_count = 4;

constexpr std::array<need, need_count> all_needs{ need::unneeded_fail,
                                                  need::unneeded_win,
                                                  need::fake_needed,
                                                  need::needed };

std::string_view need_name(need n);      // "NEEDED"
std::string_view need_lua_key(need n);   // "needed"
std::optional<need> need_parse(std::string_view lua_key);

enum class scope : int { standard = 0, full = 1 };

std::string_view scope_name(scope s);  // "standard"
std::optional<scope> scope_parse(std::string_view name);

}  // namespace forcegen
