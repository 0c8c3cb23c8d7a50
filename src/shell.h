#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shipit {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
};

enum class shell_choice { bash, sh };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  shell_choice shell{ shell_choice::bash };
  // Child inherits stdin/stdout/stderr; line callbacks are not invoked.
  bool interactive{ false };
  // Piped mode only: the child reads the caller's stdin instead of /dev/null.
  bool inherit_stdin{ false };
};

shell_env_t shell_getenv();

// Run script text with cfg.shell. The script is written to a private temp file.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

// Run argv directly (argv[0] must be an absolute path). cfg.shell is ignored.
shell_result process_run(std::vector<std::string> const &argv, shell_run_cfg const &cfg);

}  // namespace shipit
