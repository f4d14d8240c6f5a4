#include "cmd_list.h"

#include "cmd_common.h"
#include "derive.h"
#include "registry.h"
#include "scenario.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <string_view>

namespace forcegen {

namespace {

std::string column(std::string_view text) {
  std::string result{ text };
  if (result.size() < 8) { result.resize(8, ' '); }
  return result;
}

}  // namespace

std::vector<std::string> list_lines(registry const &reg, bool include_skipped) {
  std::vector<std::string> lines;
  for (auto const &[s, d] : derive_all(enumerate(reg))) {
    if (d.skipped()) {
      if (include_skipped) {
        lines.push_back("skip  " + column("-") + "  " + describe(s) + ": " + *d.skip_reason);
      }
      continue;
    }
    lines.push_back("run   " + column(scope_name(d.effective_scope)) + "  " + describe(s) +
                    ": status " + std::to_string(d.status));
  }
  return lines;
}

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List scenarios and their expected outcomes") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--profiles", cfg_ptr->profiles_path, "Lua profile definitions")
      ->check(CLI::ExistingFile);
  sub->add_flag("--all", cfg_ptr->include_skipped, "Include skipped scenarios");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cmd_list::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_list::execute() {
  auto const reg{ load_registry(cfg_.profiles_path) };
  for (auto const &line : list_lines(*reg, cfg_.include_skipped)) {
    tui::print_stdout("%s\n", line.c_str());
  }
}

}  // namespace forcegen
