#include "need.h"

#include "doctest/doctest.h"

TEST_CASE("need names follow declaration order") {
  CHECK(forcegen::need_count == 4);
  CHECK(forcegen::need_name(forcegen::all_needs[0]) == "UNNEEDED_FAIL");
  CHECK(forcegen::need_name(forcegen::all_needs[1]) == "UNNEEDED_WIN");
  CHECK(forcegen::need_name(forcegen::all_needs[2]) == "FAKE_NEEDED");
  CHECK(forcegen::need_name(forcegen::all_needs[3]) == "NEEDED");
}

TEST_CASE("need_parse round-trips lua keys") {
  for (auto const n : forcegen::all_needs) {
    auto const parsed{ forcegen::need_parse(forcegen::need_lua_key(n)) };
    REQUIRE(parsed.has_value());
    CHECK(*parsed == n);
  }
}

TEST_CASE("need_parse rejects display names and unknown keys") {
  CHECK_FALSE(forcegen::need_parse("NEEDED").has_value());
  CHECK_FALSE(forcegen::need_parse("sometimes").has_value());
  CHECK_FALSE(forcegen::need_parse("").has_value());
}

TEST_CASE("scope parse and name") {
  CHECK(forcegen::scope_parse("standard") == forcegen::scope::standard);
  CHECK(forcegen::scope_parse("full") == forcegen::scope::full);
  CHECK_FALSE(forcegen::scope_parse("quick").has_value());
  CHECK(forcegen::scope_name(forcegen::scope::standard) == "standard");
  CHECK(forcegen::scope_name(forcegen::scope::full) == "full");
}
