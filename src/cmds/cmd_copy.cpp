#include "cmd_copy.h"

#include "cmd_common.h"

#include "CLI11.hpp"

#include <memory>

namespace shipit {

void cmd_copy::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("copy", "Copy a local file into the remote directory") };
  sub->alias("cp");
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("file", cfg_ptr->file, "Local file, relative to the current directory")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_copy::cmd_copy(cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_copy::execute() { load_engine_or_throw(globals_)->copy_to_remote(cfg_.file); }

}  // namespace shipit
