#pragma once

#include "cmd.h"
#include "emit.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace forcegen {

class cmd_generate : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_generate> {
    std::optional<std::filesystem::path> profiles_path;
    std::optional<std::filesystem::path> output_path;  // stdout when unset
    generate_options options;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_generate(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace forcegen
