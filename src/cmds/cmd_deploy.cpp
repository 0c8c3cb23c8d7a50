#include "cmd_deploy.h"

#include "cmd_common.h"

#include "CLI11.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shipit {

void cmd_deploy::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto cfg_ptr{ std::make_shared<cfg>() };
  auto *target_opt{
    app.add_option("target", cfg_ptr->target, "Target to deploy")->default_str(kDefaultTarget)
  };
  app.callback([&app, target_opt, cfg_ptr, on_selected = std::move(on_selected)] {
    if (app.get_subcommands().empty()) {
      on_selected(*cfg_ptr);
      return;
    }
    // Subcommand positionals fall through to here once the subcommand's own are full.
    if (target_opt->count() > 0) {
      throw CLI::ExtrasError(std::vector<std::string>{ cfg_ptr->target });
    }
  });
}

cmd_deploy::cmd_deploy(cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_deploy::execute() { load_engine_or_throw(globals_)->deploy(cfg_.target); }

}  // namespace shipit
