#include "profile.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <string_view>

namespace forcegen {

namespace {

[[noreturn]] void throw_defect(std::string const &profile_name, std::string const &what) {
  throw std::runtime_error("profile '" + profile_name + "': " + what);
}

template <typename T>
std::optional<T> first_of(std::optional<T> const &over,
                          std::optional<T> const &category,
                          std::optional<T> const &baseline) {
  if (over) { return over; }
  if (category) { return category; }
  return baseline;
}

bool valid_name(std::string_view name) {
  return !name.empty() && std::ranges::all_of(name, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  });
}

// Commands and images land on a single Dockerfile line.
void check_single_line(std::string const &profile_name,
                       std::string const &what,
                       std::string const &value) {
  if (value.find('\n') != std::string::npos) {
    throw_defect(profile_name, what + " must be a single line");
  }
}

}  // namespace

std::optional<std::string> const &profile::command(need n) const {
  return needs[static_cast<std::size_t>(n)];
}

category_template const &baseline_category() {
  static category_template const baseline{ [] {
    category_template c;
    c.name = "baseline";
    c.default_scope = scope::full;
    c.arch_excludes = std::vector<std::string>{};
    c.needs[static_cast<std::size_t>(need::unneeded_fail)] = "false";
    c.needs[static_cast<std::size_t>(need::unneeded_win)] = "true";
    return c;
  }() };
  return baseline;
}

profile compose(category_template const &category,
                profile_override const &over,
                capability_hook const *hook) {
  auto const &baseline{ baseline_category() };

  if (over.name.empty()) { throw std::runtime_error("profile name is required"); }

  if (!valid_name(over.name)) {
    throw_defect(over.name, "name may only contain letters, digits, '.', '_' and '-'");
  }

  profile p;
  p.name = over.name;
  p.base = over.base;
  if (p.base.empty()) { throw_defect(p.name, "base image is required"); }
  check_single_line(p.name, "base image", p.base);

  auto const config{ first_of(over.config, category.config, baseline.config) };
  if (!config || config->empty()) { throw_defect(p.name, "config is required"); }
  p.config = *config;

  p.default_scope =
      first_of(over.default_scope, category.default_scope, baseline.default_scope)
          .value_or(scope::full);
  p.arch_excludes =
      first_of(over.arch_excludes, category.arch_excludes, baseline.arch_excludes)
          .value_or(std::vector<std::string>{});
  p.prep_run = first_of(over.prep_run, category.prep_run, baseline.prep_run);
  if (p.prep_run && p.prep_run->empty()) {
    throw_defect(p.name, "prep_run cannot be empty");
  }
  if (p.prep_run) { check_single_line(p.name, "prep_run", *p.prep_run); }

  for (auto const n : all_needs) {
    auto const idx{ static_cast<std::size_t>(n) };
    p.needs[idx] = std::visit(
        match{ [&](need_inherit) {
                return first_of(std::optional<std::string>{},
                                category.needs[idx],
                                baseline.needs[idx]);
              },
               [](std::string const &cmd) { return std::optional<std::string>{ cmd }; },
               [](need_remove) { return std::optional<std::string>{}; } },
        over.needs[idx]);

    if (p.needs[idx] && p.needs[idx]->empty()) {
      throw_defect(p.name, "command for " + std::string(need_name(n)) + " is empty");
    }
    if (p.needs[idx]) {
      check_single_line(p.name, "command for " + std::string(need_name(n)), *p.needs[idx]);
    }
  }

  for (auto const n : { need::unneeded_fail, need::unneeded_win }) {
    if (!p.has_command(n)) {
      throw_defect(p.name, "command for " + std::string(need_name(n)) + " is required");
    }
  }

  if (over.hook && !hook) { throw_defect(p.name, "unknown hook '" + *over.hook + "'"); }
  p.hook = hook;

  return p;
}

}  // namespace forcegen
