#pragma once

#include "need.h"

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace forcegen {

// Command per need category; an empty slot means the category does not apply.
using need_map = std::array<std::optional<std::string>, need_count>;

// Cross-cutting side effect to verify after each build, e.g. that EPEL was
// installed. Attached to profiles independently of their category.
struct capability_hook {
  struct file_check {
    std::string pattern;  // extended regex grepped in the file
    std::string path;     // absolute path inside the image, may contain globs
  };

  std::string name;
  std::string description;
  std::vector<std::string> output_patterns;  // extended regexes matched in build log
  std::vector<file_check> file_checks;
};

// Package-manager family defaults shared by several distributions.
struct category_template {
  std::string name;
  std::optional<std::string> config;
  std::optional<scope> default_scope;
  std::optional<std::vector<std::string>> arch_excludes;
  std::optional<std::string> prep_run;
  need_map needs;
};

struct need_inherit {};
struct need_remove {};
using need_override = std::variant<need_inherit, std::string, need_remove>;

// Per-distribution record; every optional field left empty falls back to the
// category, then to the root baseline.
struct profile_override {
  std::string name;
  std::string category;
  std::string base;
  std::optional<std::string> config;
  std::optional<scope> default_scope;
  std::optional<std::vector<std::string>> arch_excludes;
  std::optional<std::string> prep_run;
  std::array<need_override, need_count> needs{};
  std::optional<std::string> hook;
};

struct profile {
  std::string name;
  std::string base;    // base image reference
  std::string config;  // --force configuration name selected for this dialect
  scope default_scope{ scope::full };
  std::vector<std::string> arch_excludes;
  std::optional<std::string> prep_run;
  need_map needs;
  capability_hook const *hook{ nullptr };  // owned by the registry

  std::optional<std::string> const &command(need n) const;
  bool has_command(need n) const { return command(n).has_value(); }
};

// Root of every category: commands that fail or succeed regardless of --force.
category_template const &baseline_category();

// Merge with override-wins-else-category-else-baseline precedence and validate
// the result. Throws std::runtime_error naming the profile on a defect.
profile compose(category_template const &category,
                profile_override const &over,
                capability_hook const *hook);

}  // namespace forcegen
