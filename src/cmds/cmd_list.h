#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace forcegen {

class registry;

// One line per scenario: "run   <scope>  <label>: status N", or
// "skip  -         <label>: <reason>" when include_skipped is set.
std::vector<std::string> list_lines(registry const &reg, bool include_skipped);

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {
    std::optional<std::filesystem::path> profiles_path;
    bool include_skipped{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_list(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace forcegen
