#include "emit.h"

#include "registry.h"

#include "doctest/doctest.h"

#include <sstream>
#include <string>

namespace {

using forcegen::need;

forcegen::profile alpine_profile() {
  forcegen::profile p;
  p.name = "alpine_3.9";
  p.base = "alpine:3.9";
  p.config = "alpine";
  p.arch_excludes = { "ppc64le" };
  p.needs[static_cast<std::size_t>(need::unneeded_fail)] = "false";
  p.needs[static_cast<std::size_t>(need::unneeded_win)] = "true";
  p.needs[static_cast<std::size_t>(need::fake_needed)] = "apk add ed";
  p.needs[static_cast<std::size_t>(need::needed)] = "apk add dbus";
  return p;
}

std::string emit_one(forcegen::scenario const &s,
                     forcegen::generate_options const &opts = {}) {
  std::ostringstream oss;
  forcegen::emit_scenario(oss, { s, forcegen::derive(s) }, opts);
  return oss.str();
}

bool contains(std::string const &haystack, std::string const &needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("emit_preamble loads common helpers and guards the builder") {
  std::ostringstream oss;
  forcegen::emit_preamble(oss, {});
  auto const text{ oss.str() };

  CHECK(text.starts_with("# This file is generated by forcegen."));
  CHECK(contains(text, "\nload ../common\n"));
  CHECK(contains(text, "[[ $CH_TEST_BUILDER = 'ch-image' ]] || skip 'ch-image only'"));
}

TEST_CASE("emit_preamble quotes the builder name") {
  forcegen::generate_options opts;
  opts.builder = "o'brien build";
  std::ostringstream oss;
  forcegen::emit_preamble(oss, opts);

  CHECK(contains(oss.str(),
                 "    [[ $CH_TEST_BUILDER = 'o'\\''brien' ]] || skip 'o'\\''brien only'\n"));
}

TEST_CASE("emit_scenario writes a single-build test block") {
  auto const p{ alpine_profile() };
  auto const text{ emit_one({ .prof = &p,
                              .category = need::needed,
                              .forced = false,
                              .preprep = false }) };

  CHECK(text ==
        "\n"
        "@test \"ch-image --force: alpine_3.9, NEEDED, w/o --force, no preprep\" {\n"
        "    scope standard\n"
        "    arch_exclude ppc64le\n"
        "\n"
        "    # build 1: skipped, no preparatory image\n"
        "\n"
        "    # build 2: image under test\n"
        "    run ch-image -v build -t tmpimg2 -f - . << 'EOF'\n"
        "FROM alpine:3.9\n"
        "RUN apk add dbus\n"
        "EOF\n"
        "    echo \"$output\"\n"
        "    [[ $status -eq 1 ]]\n"
        "    echo \"$output\" | grep -Fq -- 'available --force: alpine'\n"
        "    echo \"$output\" | grep -Fq -- 'RUN: available here with --force'\n"
        "    echo \"$output\" | grep -Fq -- 'build failed: --force may fix it'\n"
        "}\n");
}

TEST_CASE("emit_scenario passes --force to the builder") {
  auto const p{ alpine_profile() };
  auto const text{ emit_one({ .prof = &p,
                              .category = need::unneeded_win,
                              .forced = true,
                              .preprep = false }) };

  CHECK(contains(text, "    scope full\n"));
  CHECK(contains(text, "    run ch-image -v build --force -t tmpimg2 -f - . << 'EOF'\n"));
  CHECK(contains(text, "RUN true\n"));
  CHECK(contains(text, "    [[ $status -eq 0 ]]\n"));
  CHECK(contains(text, "grep -Fq -- 'warning: --force specified, but nothing to do'"));
}

TEST_CASE("emit_scenario quotes apostrophes") {
  auto const p{ alpine_profile() };
  auto const text{ emit_one({ .prof = &p,
                              .category = need::unneeded_fail,
                              .forced = false,
                              .preprep = false }) };

  CHECK(contains(text, "grep -Fq -- 'build failed: current version of --force wouldn'\\''t help'"));
}

TEST_CASE("emit_scenario writes a skip comment") {
  auto const p{ alpine_profile() };
  auto const text{ emit_one({ .prof = &p,
                              .category = need::needed,
                              .forced = true,
                              .preprep = true }) };

  CHECK(text == "\n# skip: alpine_3.9, NEEDED, with --force, preprep: no preparation command\n");
}

TEST_CASE("emit_scenario two-build block with hook assertions") {
  forcegen::capability_hook hook;
  hook.name = "epel";
  hook.description = "EPEL installed";
  hook.output_patterns = { "(Updating|Installing).+: epel-release" };
  hook.file_checks = { { .pattern = "enabled=1", .path = "/etc/yum.repos.d/epel*.repo" } };

  forcegen::profile p;
  p.name = "centos_7";
  p.base = "centos:7";
  p.config = "rhel7";
  p.prep_run = "yum install -y epel-release";
  p.needs[static_cast<std::size_t>(need::needed)] = "yum install -y openssh";
  p.hook = &hook;

  auto const text{ emit_one({ .prof = &p,
                              .category = need::needed,
                              .forced = true,
                              .preprep = true }) };

  CHECK(text ==
        "\n"
        "@test \"ch-image --force: centos_7, NEEDED, with --force, preprep\" {\n"
        "    scope standard\n"
        "\n"
        "    # build 1: intermediate image for preparatory commands\n"
        "    run ch-image -v build -t tmpimg -f - . << 'EOF'\n"
        "FROM centos:7\n"
        "RUN yum install -y epel-release\n"
        "EOF\n"
        "    echo \"$output\"\n"
        "    [[ $status -eq 0 ]]\n"
        "    # epel: EPEL installed\n"
        "    echo \"$output\" | grep -Eq -- '(Updating|Installing).+: epel-release'\n"
        "    ls -lh \"$CH_IMAGE_STORAGE\"/img/tmpimg/etc/yum.repos.d/epel*.repo\n"
        "    grep -Eq -- 'enabled=1' \"$CH_IMAGE_STORAGE\"/img/tmpimg/etc/yum.repos.d/epel*.repo\n"
        "\n"
        "    # build 2: image under test\n"
        "    run ch-image -v build --force -t tmpimg2 -f - . << 'EOF'\n"
        "FROM tmpimg\n"
        "RUN yum install -y openssh\n"
        "EOF\n"
        "    echo \"$output\"\n"
        "    [[ $status -eq 0 ]]\n"
        "    echo \"$output\" | grep -Fq -- 'will use --force: rhel7'\n"
        "    echo \"$output\" | grep -Fq -- '--force: init OK & modified 1 RUN instructions'\n"
        "    # epel: EPEL installed\n"
        "    ! echo \"$output\" | grep -Eq -- '(Updating|Installing).+: epel-release' || false\n"
        "    ! ( ls -lh \"$CH_IMAGE_STORAGE\"/img/tmpimg2/etc/yum.repos.d/epel*.repo && grep -Eq "
        "-- 'enabled=1' \"$CH_IMAGE_STORAGE\"/img/tmpimg2/etc/yum.repos.d/epel*.repo ) || false\n"
        "}\n");
}

TEST_CASE("emit_scenario honors generate options") {
  auto const p{ alpine_profile() };
  forcegen::generate_options opts;
  opts.builder = "ch-image build";
  opts.name_prefix = "force";
  opts.final_tag = "final";
  opts.context = "/tmp/ctx";

  auto const text{ emit_one({ .prof = &p,
                              .category = need::fake_needed,
                              .forced = true,
                              .preprep = false },
                            opts) };

  CHECK(contains(text, "@test \"force: alpine_3.9, FAKE_NEEDED, with --force, no preprep\""));
  CHECK(contains(text, "run ch-image build --force -t final -f - /tmp/ctx << 'EOF'"));
}

TEST_CASE("render is deterministic and counts tests") {
  auto const reg{ forcegen::registry::builtin() };
  auto const first{ forcegen::render(*reg, {}) };
  auto const second{ forcegen::render(*reg, {}) };

  CHECK(first.text == second.text);
  CHECK(first.tests + first.skipped == reg->profiles().size() * 16);
  CHECK(first.tests > 0);
  CHECK(first.skipped > 0);

  std::size_t blocks{ 0 };
  std::size_t skips{ 0 };
  for (std::size_t pos{ 0 }; (pos = first.text.find("\n@test \"", pos)) != std::string::npos;
       ++pos) {
    ++blocks;
  }
  for (std::size_t pos{ 0 }; (pos = first.text.find("\n# skip: ", pos)) != std::string::npos;
       ++pos) {
    ++skips;
  }
  CHECK(blocks == first.tests);
  CHECK(skips == first.skipped);
}

TEST_CASE("render emits scenarios in enumeration order") {
  auto const reg{ forcegen::registry::builtin() };
  auto const text{ forcegen::render(*reg, {}).text };

  auto const centos{ text.find("centos_7, UNNEEDED_FAIL, w/o --force, no preprep") };
  auto const alpine{ text.find("alpine_edge, NEEDED, with --force, preprep") };
  REQUIRE(centos != std::string::npos);
  REQUIRE(alpine != std::string::npos);
  CHECK(centos < alpine);
}
