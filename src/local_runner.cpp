#include "local_runner.h"

#include "shell.h"
#include "tui.h"

#include <string>
#include <utility>

namespace shipit {

bool local_runner_run(std::string_view script,
                      std::function<void(std::string_view)> on_line) {
  std::string guarded{ "set -e\n" };
  guarded.append(script);

  shell_run_cfg const cfg{ .on_output_line = std::move(on_line),
                           .on_stdout_line = {},
                           .on_stderr_line = {},
                           .cwd = std::nullopt,
                           .env = shell_getenv(),
                           .shell = shell_choice::bash,
                           .interactive = false,
                           .inherit_stdin = true };

  auto const result{ shell_run(guarded, cfg) };

  if (result.signal) {
    tui::debug("Local script terminated by signal %d", *result.signal);
    return false;
  }
  if (result.exit_code != 0) {
    tui::debug("Local script exited with code %d", result.exit_code);
    return false;
  }
  return true;
}

}  // namespace shipit
