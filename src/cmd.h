#pragma once

#include "config.h"
#include "util.h"

#include <memory>
#include <optional>
#include <string>

namespace shipit {

// Options shared by every command, parsed before or after the subcommand.
struct cmd_globals {
  std::string config_name{ kDefaultConfigName };
  std::optional<std::string> remote_host;
  bool verbose{ false };
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cmd_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cmd_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace shipit
