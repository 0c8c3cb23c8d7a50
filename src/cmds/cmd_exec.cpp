#include "cmd_exec.h"

#include "cmd_common.h"

#include "CLI11.hpp"

#include <memory>

namespace shipit {

void cmd_exec::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("exec", "Run a command in the remote directory") };
  sub->alias("run");
  sub->prefix_command();
  sub->fallthrough(false);  // words after exec belong to the remote command
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback([sub, cfg_ptr, on_selected = std::move(on_selected)] {
    cfg_ptr->command = sub->remaining();
    if (cfg_ptr->command.empty()) {
      throw CLI::ValidationError("exec", "a remote command is required");
    }
    on_selected(*cfg_ptr);
  });
}

cmd_exec::cmd_exec(cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_exec::execute() { load_engine_or_throw(globals_)->exec_command(cfg_.command); }

}  // namespace shipit
