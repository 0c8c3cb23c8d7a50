#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace shipit {

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_list(cfg cfg, cmd_globals const &globals);

  void execute() override;

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace shipit
