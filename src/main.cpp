#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  forcegen::tui::init();

  auto args{ forcegen::cli_parse(argc, argv) };
  forcegen::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      forcegen::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    forcegen::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return forcegen::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    forcegen::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
