#pragma once

#include <optional>
#include <string>

namespace shipit {

struct config_document;

// Built once per invocation after the config loads; never modified afterwards.
struct deploy_context {
  std::string ssh_host;
  std::string ssh_path;
  bool verbose{ false };
};

deploy_context deploy_context_make(config_document const &doc,
                                   std::optional<std::string> const &host_override,
                                   bool verbose);

}  // namespace shipit
