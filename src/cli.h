#pragma once

#include "cmd.h"
#include "cmds/cmd_console.h"
#include "cmds/cmd_copy.h"
#include "cmds/cmd_deploy.h"
#include "cmds/cmd_exec.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace shipit {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_deploy::cfg,
                                 cmd_list::cfg,
                                 cmd_console::cfg,
                                 cmd_exec::cfg,
                                 cmd_copy::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cmd_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;       // help text or parse error
  bool help_requested{ false };  // cli_output is help, not an error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace shipit
