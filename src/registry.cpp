#include "registry.h"

#include "sol_util.h"
#include "tui.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace forcegen {

namespace {

void check_fields(sol::table const &table,
                  std::initializer_list<std::string_view> allowed,
                  std::string const &context) {
  for (auto const &[key, value] : table) {
    if (!key.is<std::string>()) {
      throw std::runtime_error(context + ": keys must be strings");
    }
    auto const name{ key.as<std::string>() };
    if (std::ranges::find(allowed, std::string_view{ name }) == allowed.end()) {
      throw std::runtime_error(context + ": unknown field '" + name + "'");
    }
  }
}

// Emitted unquoted after the image root so globs expand.
bool valid_image_path(std::string_view path) {
  return path.starts_with('/') && std::ranges::none_of(path, [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '"' ||
           c == '$' || c == '`' || c == '\\' || c == ';' || c == '&' || c == '|';
  });
}

std::optional<scope> parse_scope_field(sol::table const &table, std::string const &context) {
  auto const value{ sol_util_get_optional<std::string>(table, "scope", context) };
  if (!value) { return std::nullopt; }
  if (auto const s{ scope_parse(*value) }) { return s; }
  throw std::runtime_error(context + ": invalid scope '" + *value +
                           "' (expected 'standard' or 'full')");
}

need parse_need_key(sol::object const &key, std::string const &context) {
  if (key.is<std::string>()) {
    auto const name{ key.as<std::string>() };
    if (auto const n{ need_parse(name) }) { return *n; }
    throw std::runtime_error(context + ": unknown need '" + name + "'");
  }
  throw std::runtime_error(context + ": need keys must be strings");
}

category_template parse_category(std::string const &name, sol::table const &table) {
  std::string const context{ "category '" + name + "'" };
  check_fields(table, { "config", "scope", "arch_excludes", "prep_run", "needs" }, context);

  category_template c;
  c.name = name;
  c.config = sol_util_get_optional<std::string>(table, "config", context);
  c.default_scope = parse_scope_field(table, context);
  c.arch_excludes = sol_util_get_string_array(table, "arch_excludes", context);
  c.prep_run = sol_util_get_optional<std::string>(table, "prep_run", context);

  if (auto const needs{ sol_util_get_optional<sol::table>(table, "needs", context) }) {
    for (auto const &[key, value] : *needs) {
      auto const n{ parse_need_key(key, context) };
      if (!value.is<std::string>()) {
        throw std::runtime_error(context + ": needs." + std::string(need_lua_key(n)) +
                                 " must be a string");
      }
      c.needs[static_cast<std::size_t>(n)] = value.as<std::string>();
    }
  }

  return c;
}

capability_hook parse_hook(std::string const &name, sol::table const &table) {
  std::string const context{ "hook '" + name + "'" };
  check_fields(table, { "description", "outputs", "files" }, context);

  capability_hook h;
  h.name = name;
  h.description = sol_util_get_optional<std::string>(table, "description", context)
                      .value_or("validate " + name);
  h.output_patterns =
      sol_util_get_string_array(table, "outputs", context).value_or(std::vector<std::string>{});

  if (auto const files{ sol_util_get_optional<sol::table>(table, "files", context) }) {
    for (size_t i{ 1 }, n{ files->size() }; i <= n; ++i) {
      sol::object const entry = (*files)[i];
      if (!entry.is<sol::table>()) {
        throw std::runtime_error(context + ": files entries must be tables");
      }
      sol::table const file{ entry.as<sol::table>() };
      check_fields(file, { "pattern", "path" }, context + " files[" + std::to_string(i) + "]");
      h.file_checks.push_back(capability_hook::file_check{
          .pattern = sol_util_get_required<std::string>(file, "pattern", context),
          .path = sol_util_get_required<std::string>(file, "path", context) });
    }
  }

  return h;
}

profile_override parse_override(sol::table const &table, size_t index) {
  std::string const position{ "PROFILES[" + std::to_string(index) + "]" };
  auto const name{ sol_util_get_required<std::string>(table, "name", position) };
  std::string const context{ "profile '" + name + "'" };

  check_fields(table,
               { "name",
                 "category",
                 "base",
                 "config",
                 "scope",
                 "arch_excludes",
                 "prep_run",
                 "needs",
                 "hook" },
               context);

  profile_override o;
  o.name = name;
  o.category = sol_util_get_required<std::string>(table, "category", context);
  o.base = sol_util_get_required<std::string>(table, "base", context);
  o.config = sol_util_get_optional<std::string>(table, "config", context);
  o.default_scope = parse_scope_field(table, context);
  o.arch_excludes = sol_util_get_string_array(table, "arch_excludes", context);
  o.prep_run = sol_util_get_optional<std::string>(table, "prep_run", context);
  o.hook = sol_util_get_optional<std::string>(table, "hook", context);

  if (auto const needs{ sol_util_get_optional<sol::table>(table, "needs", context) }) {
    for (auto const &[key, value] : *needs) {
      auto const n{ parse_need_key(key, context) };
      auto &slot{ o.needs[static_cast<std::size_t>(n)] };
      if (value.is<std::string>()) {
        slot = value.as<std::string>();
      } else if (value.get_type() == sol::type::boolean && !value.as<bool>()) {
        slot = need_remove{};
      } else {
        throw std::runtime_error(context + ": needs." + std::string(need_lua_key(n)) +
                                 " must be a string or false");
      }
    }
  }

  return o;
}

}  // namespace

std::unique_ptr<registry> registry::create(std::vector<category_template> categories,
                                           std::vector<capability_hook> hooks,
                                           std::vector<profile_override> overrides) {
  std::unique_ptr<registry> r{ new registry{} };

  std::unordered_map<std::string, category_template> category_table;
  for (auto &c : categories) {
    std::string const name{ c.name };
    if (!category_table.emplace(name, std::move(c)).second) {
      throw std::runtime_error("category '" + name + "': defined more than once");
    }
  }

  for (auto &h : hooks) {
    if (h.output_patterns.empty() && h.file_checks.empty()) {
      throw std::runtime_error("hook '" + h.name + "': needs outputs or files");
    }
    for (auto const &f : h.file_checks) {
      if (!valid_image_path(f.path)) {
        throw std::runtime_error("hook '" + h.name + "': invalid file path '" + f.path +
                                 "' (must be absolute, no spaces or quotes)");
      }
    }
    std::string const name{ h.name };
    if (!r->hooks_.emplace(name, std::move(h)).second) {
      throw std::runtime_error("hook '" + name + "': defined more than once");
    }
  }

  if (overrides.empty()) { throw std::runtime_error("registry defines no profiles"); }

  std::unordered_set<std::string> seen;
  r->profiles_.reserve(overrides.size());
  for (auto const &o : overrides) {
    if (!seen.insert(o.name).second) {
      throw std::runtime_error("profile '" + o.name + "': defined more than once");
    }

    auto const category{ category_table.find(o.category) };
    if (category == category_table.end()) {
      throw std::runtime_error("profile '" + o.name + "': unknown category '" +
                               o.category + "'");
    }

    capability_hook const *hook{ nullptr };
    if (o.hook) {
      if (auto const it{ r->hooks_.find(*o.hook) }; it != r->hooks_.end()) {
        hook = &it->second;
      }
    }

    r->profiles_.push_back(compose(category->second, o, hook));
    tui::trace("registry: profile %s (base %s, config %s)",
               o.name.c_str(),
               r->profiles_.back().base.c_str(),
               r->profiles_.back().config.c_str());
  }

  return r;
}

std::unique_ptr<registry> registry::load(std::filesystem::path const &path) {
  tui::debug("Loading profiles from file: %s", path.string().c_str());
  auto const content{ util_load_file(path) };
  return load(std::string_view{ reinterpret_cast<char const *>(content.data()),
                                content.size() },
              path.string());
}

std::unique_ptr<registry> registry::load(std::string_view script,
                                         std::string const &chunk_name) {
  auto lua{ sol_util_make_lua_state() };
  sol_util_run_script(*lua, script, chunk_name);

  std::vector<category_template> categories;
  sol::object const categories_obj = (*lua)["CATEGORIES"];
  if (!categories_obj.valid() || categories_obj.get_type() != sol::type::table) {
    throw std::runtime_error(chunk_name + ": must define 'CATEGORIES' global as a table");
  }
  for (auto const &[key, value] : categories_obj.as<sol::table>()) {
    if (!key.is<std::string>() || !value.is<sol::table>()) {
      throw std::runtime_error(chunk_name + ": CATEGORIES entries must be name = { ... }");
    }
    categories.push_back(parse_category(key.as<std::string>(), value.as<sol::table>()));
  }

  std::vector<capability_hook> hooks;
  sol::object const hooks_obj = (*lua)["HOOKS"];
  if (hooks_obj.valid() && hooks_obj.get_type() != sol::type::lua_nil) {
    if (hooks_obj.get_type() != sol::type::table) {
      throw std::runtime_error(chunk_name + ": 'HOOKS' global must be a table");
    }
    for (auto const &[key, value] : hooks_obj.as<sol::table>()) {
      if (!key.is<std::string>() || !value.is<sol::table>()) {
        throw std::runtime_error(chunk_name + ": HOOKS entries must be name = { ... }");
      }
      hooks.push_back(parse_hook(key.as<std::string>(), value.as<sol::table>()));
    }
  }

  std::vector<profile_override> overrides;
  sol::object const profiles_obj = (*lua)["PROFILES"];
  if (!profiles_obj.valid() || profiles_obj.get_type() != sol::type::table) {
    throw std::runtime_error(chunk_name + ": must define 'PROFILES' global as a table");
  }
  sol::table const profiles_table{ profiles_obj.as<sol::table>() };
  for (size_t i{ 1 }, n{ profiles_table.size() }; i <= n; ++i) {
    sol::object const entry = profiles_table[i];
    if (!entry.is<sol::table>()) {
      throw std::runtime_error(chunk_name + ": PROFILES[" + std::to_string(i) +
                               "] must be a table");
    }
    overrides.push_back(parse_override(entry.as<sol::table>(), i));
  }

  tui::debug("Loaded %zu categories, %zu hooks, %zu profiles from %s",
             categories.size(),
             hooks.size(),
             overrides.size(),
             chunk_name.c_str());

  return create(std::move(categories), std::move(hooks), std::move(overrides));
}

std::unique_ptr<registry> registry::builtin() {
  return load(kBuiltinProfiles, "builtin profiles");
}

profile const *registry::find(std::string_view name) const {
  auto const it{ std::ranges::find_if(profiles_,
                                      [name](profile const &p) { return p.name == name; }) };
  return it == profiles_.end() ? nullptr : &*it;
}

}  // namespace forcegen
