#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace shipit {

class cmd_exec : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_exec> {
    std::vector<std::string> command;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_exec(cfg cfg, cmd_globals const &globals);

  void execute() override;

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace shipit
