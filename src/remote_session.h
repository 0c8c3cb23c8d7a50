#pragma once

#include "deploy_context.h"
#include "shell.h"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

// Exit status of the guard script when the configured remote path is not a directory.
// Only the guard produces it; a body exiting with it is reported with
// kRemoteBodyReservedExit instead.
inline constexpr int kRemoteDirMissingExit{ 85 };
inline constexpr int kRemoteBodyReservedExit{ 1 };

struct remote_run_opts {
  bool tty{ false };  // request a pseudo-terminal and hand the terminal to ssh
};

// set -e, check the remote directory, cd into it, then run body in a subshell.
std::string remote_session_script(std::string_view remote_path, std::string_view body);

std::vector<std::string> remote_session_argv(deploy_context const &ctx,
                                             std::string_view script,
                                             remote_run_opts const &opts);

shell_result remote_session_run(deploy_context const &ctx,
                                std::string_view body,
                                remote_run_opts const &opts,
                                std::function<void(std::string_view)> on_line = {});

// Destination is <ssh_path>/<local_file> on ssh_host.
std::vector<std::string> remote_copy_argv(deploy_context const &ctx,
                                          std::filesystem::path const &local_file);

shell_result remote_copy(deploy_context const &ctx, std::filesystem::path const &local_file);

}  // namespace shipit
