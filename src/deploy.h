#pragma once

#include "config.h"
#include "deploy_context.h"
#include "remote_session.h"
#include "shell.h"
#include "util.h"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace shipit {

// Execution capabilities the engine depends on. Production code binds these to
// local_runner and remote_session; tests substitute recorders.
struct deploy_transport {
  std::function<bool(std::string_view script)> run_local;
  std::function<shell_result(deploy_context const &ctx,
                             std::string_view body,
                             remote_run_opts const &opts)>
      run_remote;
  std::function<shell_result(deploy_context const &ctx,
                             std::filesystem::path const &local_file)>
      copy_file;
};

deploy_transport deploy_transport_default();

class deploy_engine : unmovable {
 public:
  deploy_engine(config_document doc, deploy_context ctx, deploy_transport transport);

  // Local phase, then remote phase. A failed local phase skips the remote phase.
  void deploy(std::string_view target);

  std::vector<std::string> list_targets() const;
  void open_console();
  void exec_command(std::vector<std::string> const &cmdline);
  void copy_to_remote(std::filesystem::path const &local_file);

  config_document const &document() const { return doc_; }

 private:
  void run_remote_or_throw(std::string_view body,
                           remote_run_opts const &opts,
                           std::string_view what);

  config_document doc_;
  deploy_context const ctx_;
  deploy_transport transport_;
};

}  // namespace shipit
