#include "cmd_check.h"

#include "cmd_common.h"
#include "registry.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace forcegen {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Validate profile definitions") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--profiles", cfg_ptr->profiles_path, "Lua profile definitions")
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_check::cmd_check(cmd_check::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_check::execute() {
  auto const reg{ load_registry(cfg_.profiles_path) };
  tui::debug("%zu hooks", reg->hooks().size());
  tui::print_stdout("%zu profiles OK\n", reg->profiles().size());
}

}  // namespace forcegen
