#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"

#ifndef SHIPIT_VERSION_STR
#error "SHIPIT_VERSION_STR must be defined by the build system"
#endif

namespace shipit {

cmd_version::cmd_version(cfg cfg, cmd_globals const & /*globals*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::print_stdout("shipit %s\n", SHIPIT_VERSION_STR);
  tui::print_stdout("CLI11 %s\n", CLI11_VERSION);
}

}  // namespace shipit
