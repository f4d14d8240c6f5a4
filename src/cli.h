#pragma once

#include "cmds/cmd_check.h"
#include "cmds/cmd_generate.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace forcegen {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_check::cfg, cmd_generate::cfg, cmd_list::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;  // help or parse error text
};

cli_args cli_parse(int argc, char **argv);

}  // namespace forcegen
