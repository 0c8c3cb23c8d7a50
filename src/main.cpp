#include "cli.h"
#include "error.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  shipit::tui::init();

  auto args{ shipit::cli_parse(argc, argv) };
  shipit::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (args.help_requested) {
    shipit::tui::print_stdout("%s", args.cli_output.c_str());
    return EXIT_SUCCESS;
  }

  if (!args.cli_output.empty() || !args.cmd_cfg.has_value()) {
    shipit::tui::error("%s", args.cli_output.c_str());
    return EXIT_FAILURE;
  }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return shipit::cmd::create(cfg, args.globals); },
      *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (shipit::error const &ex) {
    auto const kind{ shipit::errc_name(ex.code()) };
    shipit::tui::debug("%.*s", static_cast<int>(kind.size()), kind.data());
    shipit::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    shipit::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
