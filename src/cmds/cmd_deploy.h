#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace shipit {

inline constexpr char kDefaultTarget[]{ "deploy" };

class cmd_deploy : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_deploy> {
    std::string target{ kDefaultTarget };
  };

  // Registers the top-level <target> positional; selected when no subcommand runs.
  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_deploy(cfg cfg, cmd_globals const &globals);

  void execute() override;

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace shipit
