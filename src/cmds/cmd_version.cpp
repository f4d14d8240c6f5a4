#include "cmd_version.h"

#include "CLI/CLI.hpp"
#include "sol/sol.hpp"
#include "tui.h"

#include <memory>

#ifndef FORCEGEN_VERSION_STR
#error "FORCEGEN_VERSION_STR must be defined by the build system"
#endif

namespace forcegen {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("forcegen version %s", FORCEGEN_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace forcegen
