#include "cmd_common.h"

#include "config.h"
#include "deploy_context.h"

namespace shipit {

std::unique_ptr<deploy_engine> load_engine_or_throw(cmd_globals const &globals) {
  auto doc{ config_load(config_find(globals.config_name)) };
  auto ctx{ deploy_context_make(doc, globals.remote_host, globals.verbose) };
  return std::make_unique<deploy_engine>(std::move(doc),
                                         std::move(ctx),
                                         deploy_transport_default());
}

}  // namespace shipit
