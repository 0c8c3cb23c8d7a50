#include "cmd_console.h"

#include "cmd_common.h"

#include "CLI11.hpp"

namespace shipit {

void cmd_console::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("console", "Open a login shell in the remote directory") };
  sub->alias("shell");
  sub->alias("ssh");
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_console::cmd_console(cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_console::execute() { load_engine_or_throw(globals_)->open_console(); }

}  // namespace shipit
