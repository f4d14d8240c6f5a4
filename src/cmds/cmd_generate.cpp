#include "cmd_generate.h"

#include "cmd_common.h"
#include "registry.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>

namespace forcegen {

void cmd_generate::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("generate", "Write the --force test script") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--profiles", cfg_ptr->profiles_path, "Lua profile definitions")
      ->check(CLI::ExistingFile);
  sub->add_option("-o,--output", cfg_ptr->output_path, "Output file (default: stdout)");
  sub->add_option("--builder", cfg_ptr->options.builder, "Build command under test")
      ->capture_default_str();
  sub->add_option("--name-prefix", cfg_ptr->options.name_prefix, "Test name prefix")
      ->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_generate::cmd_generate(cmd_generate::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_generate::execute() {
  auto const &opts{ cfg_.options };
  if (opts.builder.empty()) { throw std::runtime_error("generate: builder is required"); }
  // The prefix lands inside a double-quoted test name.
  if (opts.name_prefix.find_first_of("\"\n$`\\") != std::string::npos) {
    throw std::runtime_error(
        "generate: name prefix cannot contain '\"', newline, '$', '`' or '\\'");
  }

  auto const reg{ load_registry(cfg_.profiles_path) };
  auto const result{ render(*reg, opts) };

  if (cfg_.output_path) {
    util_write_file_atomic(*cfg_.output_path, result.text);
    tui::debug("Wrote %s", cfg_.output_path->string().c_str());
  } else {
    tui::write_stdout(result.text);
  }

  tui::info("%zu tests, %zu skipped", result.tests, result.skipped);
}

}  // namespace forcegen
