#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace shipit {

class cmd_console : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_console> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_console(cfg cfg, cmd_globals const &globals);

  void execute() override;

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace shipit
