#include "target.h"

#include <algorithm>

namespace shipit {

resolved_target target_resolve(config_document const &doc, std::string_view name) {
  resolved_target result{ .name = std::string{ name },
                          .local_script = std::nullopt,
                          .remote_script = std::nullopt };

  for (auto const &section : doc.sections) {
    if (section.name != name) { continue; }
    auto &slot{ section.is_local ? result.local_script : result.remote_script };
    if (!slot) { slot = section.body; }
  }

  return result;
}

bool target_exists(config_document const &doc, std::string_view name) {
  return std::ranges::any_of(doc.sections,
                             [name](auto const &section) { return section.name == name; });
}

std::vector<std::string> target_list(config_document const &doc) {
  std::vector<std::string> names;
  for (auto const &section : doc.sections) {
    if (std::ranges::find(names, section.name) == names.end()) {
      names.push_back(section.name);
    }
  }
  return names;
}

}  // namespace shipit
