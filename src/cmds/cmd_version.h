#pragma once

#include "cmd.h"

namespace shipit {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  cmd_version(cfg cfg, cmd_globals const &globals);

  void execute() override;

 private:
  cfg cfg_;
};

}  // namespace shipit
