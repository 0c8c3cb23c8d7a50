#pragma once

#include "config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

struct resolved_target {
  std::string name;
  std::optional<std::string> local_script;   // body of [name:local]
  std::optional<std::string> remote_script;  // body of [name]

  bool exists() const { return local_script.has_value() || remote_script.has_value(); }
};

resolved_target target_resolve(config_document const &doc, std::string_view name);

bool target_exists(config_document const &doc, std::string_view name);

// Base names in first-seen order, each listed once.
std::vector<std::string> target_list(config_document const &doc);

}  // namespace shipit
