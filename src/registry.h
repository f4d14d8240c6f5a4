#pragma once

#include "profile.h"
#include "util.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace forcegen {

// Ordered, deduplicated catalog of composed profiles. Profiles point into the
// registry's hook table, so a registry is neither copied nor moved.
class registry : unmovable {
 public:
  using hook_table_t = std::map<std::string, capability_hook, std::less<>>;

  // Compose and validate. Throws std::runtime_error naming the offending
  // profile, category or hook.
  static std::unique_ptr<registry> create(std::vector<category_template> categories,
                                          std::vector<capability_hook> hooks,
                                          std::vector<profile_override> overrides);

  // Execute a Lua definition setting CATEGORIES, HOOKS (optional) and PROFILES.
  static std::unique_ptr<registry> load(std::filesystem::path const &path);
  static std::unique_ptr<registry> load(std::string_view script,
                                        std::string const &chunk_name);

  // Compiled-in catalog of supported distributions.
  static std::unique_ptr<registry> builtin();

  std::vector<profile> const &profiles() const { return profiles_; }
  hook_table_t const &hooks() const { return hooks_; }
  profile const *find(std::string_view name) const;

 private:
  registry() = default;

  hook_table_t hooks_;
  std::vector<profile> profiles_;
};

// Lua source of the compiled-in catalog.
extern char const *const kBuiltinProfiles;

}  // namespace forcegen
