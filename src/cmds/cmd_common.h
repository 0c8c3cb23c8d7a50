#pragma once

#include "cmd.h"
#include "deploy.h"

#include <memory>

namespace shipit {

// Locate and parse the config, build the context, wire the default transport.
std::unique_ptr<deploy_engine> load_engine_or_throw(cmd_globals const &globals);

}  // namespace shipit
