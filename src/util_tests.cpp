#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("forcegen-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

std::string read_text(std::filesystem::path const &path) {
  std::ifstream in{ path };
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ forcegen::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_shell_quote") {
  SUBCASE("plain text") { CHECK(forcegen::util_shell_quote("apk add ed") == "'apk add ed'"); }

  SUBCASE("embedded single quote") {
    CHECK(forcegen::util_shell_quote("wouldn't help") == "'wouldn'\\''t help'");
  }

  SUBCASE("empty string") { CHECK(forcegen::util_shell_quote("") == "''"); }

  SUBCASE("shell metacharacters stay literal") {
    CHECK(forcegen::util_shell_quote("init OK & $x") == "'init OK & $x'");
  }
}

TEST_CASE("util_load_file reads bytes and throws on missing file") {
  auto const path{ make_temp_path("load") };
  forcegen::scoped_path_cleanup cleanup{ path };
  {
    std::ofstream out{ path, std::ios::binary };
    out << "forcegen";
  }

  auto const bytes{ forcegen::util_load_file(path) };
  CHECK(std::string(bytes.begin(), bytes.end()) == "forcegen");

  CHECK_THROWS_AS(forcegen::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_write_file_atomic replaces contents and leaves no temp file") {
  auto const path{ make_temp_path("atomic") };
  forcegen::scoped_path_cleanup cleanup{ path };

  forcegen::util_write_file_atomic(path, "first\n");
  CHECK(read_text(path) == "first\n");

  forcegen::util_write_file_atomic(path, "second\n");
  CHECK(read_text(path) == "second\n");

  auto tmp{ path };
  tmp += ".tmp";
  CHECK_FALSE(std::filesystem::exists(tmp));
}

TEST_CASE("util_write_file_atomic throws when directory is missing") {
  auto const path{ make_temp_path("nodir") / "out.bats" };
  CHECK_THROWS_AS(forcegen::util_write_file_atomic(path, "x"), std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("scoped_path_cleanup removes file on destruction") {
  auto const path{ make_temp_path("cleanup") };
  {
    std::ofstream out{ path };
    out << "x";
  }
  REQUIRE(std::filesystem::exists(path));
  { forcegen::scoped_path_cleanup cleanup{ path }; }
  CHECK_FALSE(std::filesystem::exists(path));
}
