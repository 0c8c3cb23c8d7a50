#include "remote_session.h"

#include "tui.h"
#include "util.h"

#include <utility>

namespace shipit {

namespace {

constexpr char kSshBinary[]{ "ssh" };
constexpr char kScpBinary[]{ "scp" };

// Quote for the remote shell while keeping a leading ~ expandable.
std::string quote_remote_path(std::string_view path) {
  if (path == "~") { return "~"; }
  if (path.starts_with("~/")) { return "~/" + util_shell_quote(path.substr(2)); }
  return util_shell_quote(path);
}

std::vector<std::string> transport_argv(char const *binary, bool verbose) {
  std::vector<std::string> argv{ "/usr/bin/env", binary };
  if (verbose) { argv.emplace_back("-v"); }
  return argv;
}

}  // namespace

std::string remote_session_script(std::string_view remote_path, std::string_view body) {
  auto const path{ quote_remote_path(remote_path) };
  auto const reserved{ std::to_string(kRemoteDirMissingExit) };

  std::string script;
  script += "set -e\n";
  script += "if [ ! -d " + path + " ]; then\n";
  script += "  printf '\\033[1;31mRemote folder %s not found\\033[0m\\n' " + path +
            " >&2\n";
  script += "  exit " + reserved + "\n";
  script += "fi\n";
  script += "cd " + path + "\n";

  // The body runs in a subshell so its own exit status can be inspected. A body
  // that exits with the reserved code is reported as a plain failure.
  script += "set +e\n";
  script += "(\nset -e\n";
  script.append(body);
  if (!body.empty() && body.back() != '\n') { script += "\n"; }
  script += ")\n";
  script += "shipit_status=$?\n";
  script += "if [ \"$shipit_status\" -eq " + reserved + " ]; then\n";
  script += "  echo 'Remote script exited with reserved status " + reserved + "' >&2\n";
  script += "  exit " + std::to_string(kRemoteBodyReservedExit) + "\n";
  script += "fi\n";
  script += "exit \"$shipit_status\"\n";
  return script;
}

std::vector<std::string> remote_session_argv(deploy_context const &ctx,
                                             std::string_view script,
                                             remote_run_opts const &opts) {
  auto argv{ transport_argv(kSshBinary, ctx.verbose) };
  argv.emplace_back("-A");  // forward the local authentication agent
  if (opts.tty) { argv.emplace_back("-t"); }
  argv.push_back(ctx.ssh_host);
  argv.emplace_back(script);
  return argv;
}

shell_result remote_session_run(deploy_context const &ctx,
                                std::string_view body,
                                remote_run_opts const &opts,
                                std::function<void(std::string_view)> on_line) {
  auto const argv{ remote_session_argv(ctx,
                                       remote_session_script(ctx.ssh_path, body),
                                       opts) };

  tui::debug("ssh %s (%s)", ctx.ssh_host.c_str(), ctx.ssh_path.c_str());

  shell_run_cfg const cfg{ .on_output_line = std::move(on_line),
                           .on_stdout_line = {},
                           .on_stderr_line = {},
                           .cwd = std::nullopt,
                           .env = shell_getenv(),
                           .shell = shell_choice::bash,
                           .interactive = opts.tty,
                           .inherit_stdin = true };

  if (opts.tty) {
    tui::interactive_mode_guard const guard;
    return process_run(argv, cfg);
  }
  return process_run(argv, cfg);
}

std::vector<std::string> remote_copy_argv(deploy_context const &ctx,
                                          std::filesystem::path const &local_file) {
  auto const relative{ local_file.is_absolute() ? local_file.filename() : local_file };

  auto argv{ transport_argv(kScpBinary, ctx.verbose) };
  argv.push_back(local_file.string());
  argv.push_back(ctx.ssh_host + ":" + ctx.ssh_path + "/" + relative.generic_string());
  return argv;
}

shell_result remote_copy(deploy_context const &ctx, std::filesystem::path const &local_file) {
  auto const argv{ remote_copy_argv(ctx, local_file) };

  tui::debug("scp %s -> %s", argv[argv.size() - 2].c_str(), argv.back().c_str());

  shell_run_cfg const cfg{ .on_output_line = {},
                           .on_stdout_line = {},
                           .on_stderr_line = {},
                           .cwd = std::nullopt,
                           .env = shell_getenv(),
                           .shell = shell_choice::bash,
                           .interactive = true,
                           .inherit_stdin = true };

  tui::interactive_mode_guard const guard;
  return process_run(argv, cfg);
}

}  // namespace shipit
