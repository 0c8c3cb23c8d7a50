#pragma once

#include <functional>
#include <string_view>

namespace shipit {

// Runs script with bash in the caller's directory, environment and stdin. The first
// failing statement stops the script. Returns false on any failure instead of
// throwing; only spawn errors (fork, pipe) propagate as exceptions.
bool local_runner_run(std::string_view script,
                      std::function<void(std::string_view)> on_line = {});

}  // namespace shipit
