#include "need.h"

#include <algorithm>
#include <array>

namespace forcegen {

namespace {

// Order must match need enum in need.h
constinit std::array<std::string_view, need_count> const need_name_table{ {
    "UNNEEDED_FAIL",
    "UNNEEDED_WIN",
    "FAKE_NEEDED",
    "NEEDED",
} };

constinit std::array<std::string_view, need_count> const need_key_table{ {
    "unneeded_fail",
    "unneeded_win",
    "fake_needed",
    "needed",
} };

constinit std::array<std::string_view, 2> const scope_name_table{ {
    "standard",
    "full",
} };

}  // namespace

std::string_view need_name(need n) {
  auto const idx{ static_cast<std::size_t>(n) };
  if (idx >= need_name_table.size()) { return "unknown"; }
  return need_name_table[idx];
}

std::string_view need_lua_key(need n) {
  auto const idx{ static_cast<std::size_t>(n) };
  if (idx >= need_key_table.size()) { return "unknown"; }
  return need_key_table[idx];
}

std::optional<need> need_parse(std::string_view lua_key) {
  if (auto it{ std::ranges::find(need_key_table, lua_key) }; it != need_key_table.end()) {
    return static_cast<need>(std::distance(need_key_table.begin(), it));
  }
  return std::nullopt;
}

std::string_view scope_name(scope s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= scope_name_table.size()) { return "unknown"; }
  return scope_name_table[idx];
}

std::optional<scope> scope_parse(std::string_view name) {
  if (auto it{ std::ranges::find(scope_name_table, name) }; it != scope_name_table.end()) {
    return static_cast<scope>(std::distance(scope_name_table.begin(), it));
  }
  return std::nullopt;
}

}  // namespace forcegen
