#include "cli.h"

#include "CLI11.hpp"

#include <string>
#include <utility>

namespace shipit {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "shipit - minimal remote deployment over ssh" };
  app.require_subcommand(0, 1);
  app.fallthrough();

  cli_args args{};

  app.add_option("-c,--config",
                 args.globals.config_name,
                 "Config file name searched upward from the current directory")
      ->default_str(kDefaultConfigName);

  std::string remote_host;
  auto *remote_opt{
    app.add_option("-r,--remote", remote_host, "Remote host (overrides config 'host')")
  };

  app.add_flag("-v,--verbose",
               args.globals.verbose,
               "Verbose ssh/scp output and decorated debug logging");

  bool version_flag{ false };
  app.add_flag("-V,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_deploy::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);
  cmd_console::register_cli(app, on_selected);
  cmd_exec::register_cli(app, on_selected);
  cmd_copy::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    args.help_requested = true;
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (remote_opt->count() > 0) { args.globals.remote_host = remote_host; }

  if (args.globals.verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (!args.cli_output.empty()) { return args; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  args.cmd_cfg = cmd_cfg;
  return args;
}

}  // namespace shipit
