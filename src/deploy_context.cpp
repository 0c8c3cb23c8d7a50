#include "deploy_context.h"

#include "config.h"
#include "tui.h"

namespace shipit {

deploy_context deploy_context_make(config_document const &doc,
                                   std::optional<std::string> const &host_override,
                                   bool verbose) {
  bool const overridden{ host_override.has_value() && !host_override->empty() };

  deploy_context ctx{ .ssh_host = overridden ? *host_override : doc.host(),
                      .ssh_path = doc.remote_path(),
                      .verbose = verbose };

  if (overridden) {
    tui::debug("Remote host overridden on command line: %s", ctx.ssh_host.c_str());
  }

  return ctx;
}

}  // namespace shipit
