#include "cmd_list.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI11.hpp"

namespace shipit {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List targets defined in the config") };
  sub->alias("ls");
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_list::cmd_list(cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_list::execute() {
  auto const engine{ load_engine_or_throw(globals_) };
  auto const targets{ engine->list_targets() };

  if (targets.empty()) {
    tui::warn("No targets defined in %s", engine->document().path.string().c_str());
    return;
  }

  for (auto const &name : targets) { tui::print_stdout("%s\n", name.c_str()); }
}

}  // namespace shipit
