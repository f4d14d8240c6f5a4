#include "cli.h"

#include "CLI/CLI.hpp"

#include <string>

namespace forcegen {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "forcegen - generate ch-image --force test scripts" };

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  bool trace{ false };
  app.add_flag("--trace", trace, "Enable trace logging (implies --verbose)");

  // Support version flags (-v / --version) triggering version command directly.
  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_generate::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);
  cmd_check::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  app.require_subcommand(0, 1);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (trace) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg && args.cli_output.empty()) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace forcegen
