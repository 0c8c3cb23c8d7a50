#include "deploy.h"

#include "error.h"
#include "local_runner.h"
#include "target.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace shipit {

namespace {

constexpr int kSshConnectionFailedExit{ 255 };
constexpr char kConsoleCommand[]{ "bash --login" };

void forward_line(std::string_view line) {
  tui::info("%.*s", static_cast<int>(line.size()), line.data());
}

std::string describe_exit(shell_result const &result) {
  if (result.signal) { return "terminated by signal " + std::to_string(*result.signal); }
  return "exit code " + std::to_string(result.exit_code);
}

}  // namespace

deploy_transport deploy_transport_default() {
  return deploy_transport{
    .run_local = [](std::string_view script) { return local_runner_run(script, forward_line); },
    .run_remote =
        [](deploy_context const &ctx, std::string_view body, remote_run_opts const &opts) {
          return remote_session_run(ctx, body, opts, forward_line);
        },
    .copy_file = [](deploy_context const &ctx,
                    std::filesystem::path const &local_file) {
      return remote_copy(ctx, local_file);
    },
  };
}

deploy_engine::deploy_engine(config_document doc,
                             deploy_context ctx,
                             deploy_transport transport)
    : doc_{ std::move(doc) }, ctx_{ std::move(ctx) }, transport_{ std::move(transport) } {}

void deploy_engine::deploy(std::string_view target) {
  auto const resolved{ target_resolve(doc_, target) };
  if (!resolved.exists()) {
    throw error(errc::target_not_found,
                "Target not found: " + resolved.name + " (in " + doc_.path.string() + ")");
  }

  if (resolved.local_script) {
    tui::header("Running local script...");
    if (!transport_.run_local(*resolved.local_script)) {
      throw error(errc::local_script_failed,
                  "Local script failed for target " + resolved.name);
    }
  }

  if (resolved.remote_script) {
    tui::header("Running remote script at %s:%s...",
                ctx_.ssh_host.c_str(),
                ctx_.ssh_path.c_str());
    run_remote_or_throw(*resolved.remote_script,
                        remote_run_opts{},
                        "Remote script for target " + resolved.name);
  }

  tui::header("Done");
}

std::vector<std::string> deploy_engine::list_targets() const { return target_list(doc_); }

void deploy_engine::open_console() {
  tui::header("Opening console on %s:%s...", ctx_.ssh_host.c_str(), ctx_.ssh_path.c_str());

  // The login shell's own exit status belongs to the user; only guard and
  // connection failures are errors.
  auto const result{
    transport_.run_remote(ctx_, kConsoleCommand, remote_run_opts{ .tty = true })
  };
  if (!result.signal && result.exit_code == kRemoteDirMissingExit) {
    throw error(errc::remote_directory_missing,
                "Remote directory not found: " + ctx_.ssh_host + ":" + ctx_.ssh_path);
  }
  if (!result.signal && result.exit_code == kSshConnectionFailedExit) {
    throw error(errc::remote_script_failed,
                "Console connection to " + ctx_.ssh_host + " failed");
  }
}

void deploy_engine::exec_command(std::vector<std::string> const &cmdline) {
  if (cmdline.empty()) { throw std::invalid_argument("exec: no command specified"); }

  auto const command{ util_join(cmdline) };
  tui::header("Running %s on %s:%s...",
              command.c_str(),
              ctx_.ssh_host.c_str(),
              ctx_.ssh_path.c_str());
  run_remote_or_throw(command, remote_run_opts{}, "Remote command '" + command + "'");
}

void deploy_engine::copy_to_remote(std::filesystem::path const &local_file) {
  std::error_code ec;
  if (!std::filesystem::exists(local_file, ec)) {
    throw error(errc::local_file_not_found, "Local file not found: " + local_file.string());
  }
  if (!std::filesystem::is_regular_file(local_file, ec)) {
    throw error(errc::local_file_not_found,
                "Local path is not a regular file: " + local_file.string());
  }

  tui::header("Copying %s to %s:%s...",
              local_file.string().c_str(),
              ctx_.ssh_host.c_str(),
              ctx_.ssh_path.c_str());

  auto const result{ transport_.copy_file(ctx_, local_file) };
  if (result.exit_code != 0 || result.signal) {
    throw error(errc::remote_script_failed,
                "Copy of " + local_file.string() + " failed (" + describe_exit(result) +
                    ")");
  }
}

void deploy_engine::run_remote_or_throw(std::string_view body,
                                        remote_run_opts const &opts,
                                        std::string_view what) {
  auto const result{ transport_.run_remote(ctx_, body, opts) };
  if (result.exit_code == 0 && !result.signal) { return; }

  if (!result.signal && result.exit_code == kRemoteDirMissingExit) {
    throw error(errc::remote_directory_missing,
                "Remote directory not found: " + ctx_.ssh_host + ":" + ctx_.ssh_path);
  }

  throw error(errc::remote_script_failed,
              std::string{ what } + " failed (" + describe_exit(result) + ")");
}

}  // namespace shipit
