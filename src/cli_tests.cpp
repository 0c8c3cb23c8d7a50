#include "cli.h"

#include "doctest.h"

#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

shipit::cli_args parse(std::vector<std::string> args) {
  args.insert(args.begin(), "shipit");
  auto argv{ make_argv(args) };
  return shipit::cli_parse(static_cast<int>(args.size()), argv.data());
}

template <typename cfg_t>
cfg_t const &require_cfg(shipit::cli_args const &parsed) {
  INFO(parsed.cli_output);
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<cfg_t>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  return *cfg;
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments deploys the default target") {
  auto const parsed{ parse({}) };
  CHECK(parsed.cli_output.empty());
  CHECK(require_cfg<shipit::cmd_deploy::cfg>(parsed).target == "deploy");
  CHECK(parsed.globals.config_name == ".shipit");
  CHECK_FALSE(parsed.globals.remote_host.has_value());
  CHECK_FALSE(parsed.globals.verbose);
}

TEST_CASE("cli_parse: positional target") {
  auto const parsed{ parse({ "migrate" }) };
  CHECK(require_cfg<shipit::cmd_deploy::cfg>(parsed).target == "migrate");
}

TEST_CASE("cli_parse: cmd_list") {
  SUBCASE("list") { require_cfg<shipit::cmd_list::cfg>(parse({ "list" })); }
  SUBCASE("ls") { require_cfg<shipit::cmd_list::cfg>(parse({ "ls" })); }
}

TEST_CASE("cli_parse: cmd_console") {
  SUBCASE("console") { require_cfg<shipit::cmd_console::cfg>(parse({ "console" })); }
  SUBCASE("shell") { require_cfg<shipit::cmd_console::cfg>(parse({ "shell" })); }
  SUBCASE("ssh") { require_cfg<shipit::cmd_console::cfg>(parse({ "ssh" })); }
}

TEST_CASE("cli_parse: cmd_exec") {
  SUBCASE("exec keeps every word verbatim") {
    auto const parsed{ parse({ "exec", "tail", "-n", "50", "--follow", "log" }) };
    CHECK(require_cfg<shipit::cmd_exec::cfg>(parsed).command ==
          std::vector<std::string>{ "tail", "-n", "50", "--follow", "log" });
  }

  SUBCASE("run alias") {
    auto const parsed{ parse({ "run", "uptime" }) };
    CHECK(require_cfg<shipit::cmd_exec::cfg>(parsed).command ==
          std::vector<std::string>{ "uptime" });
  }

  SUBCASE("options after the command word belong to the command") {
    auto const parsed{ parse({ "exec", "ls", "-v" }) };
    CHECK(require_cfg<shipit::cmd_exec::cfg>(parsed).command ==
          std::vector<std::string>{ "ls", "-v" });
    CHECK_FALSE(parsed.globals.verbose);
  }

  SUBCASE("exec without a command is a parse error") {
    auto const parsed{ parse({ "exec" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("remote command is required") != std::string::npos);
  }
}

TEST_CASE("cli_parse: cmd_copy") {
  SUBCASE("copy") {
    auto const parsed{ parse({ "copy", "config/app.env" }) };
    CHECK(require_cfg<shipit::cmd_copy::cfg>(parsed).file == "config/app.env");
  }

  SUBCASE("cp") {
    auto const parsed{ parse({ "cp", "dump.sql" }) };
    CHECK(require_cfg<shipit::cmd_copy::cfg>(parsed).file == "dump.sql");
  }

  SUBCASE("missing file is a parse error") {
    auto const parsed{ parse({ "copy" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
    CHECK_FALSE(parsed.help_requested);
  }
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-V flag") { require_cfg<shipit::cmd_version::cfg>(parse({ "-V" })); }
  SUBCASE("--version flag") { require_cfg<shipit::cmd_version::cfg>(parse({ "--version" })); }
  SUBCASE("wins over a target") {
    require_cfg<shipit::cmd_version::cfg>(parse({ "--version", "staging" }));
  }
}

TEST_CASE("cli_parse: help") {
  SUBCASE("-h") {
    auto const parsed{ parse({ "-h" }) };
    CHECK(parsed.help_requested);
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("--remote") != std::string::npos);
  }

  SUBCASE("--help") { CHECK(parse({ "--help" }).help_requested); }
}

TEST_CASE("cli_parse: global options") {
  SUBCASE("config name") {
    auto const parsed{ parse({ "-c", "deploy.conf", "list" }) };
    require_cfg<shipit::cmd_list::cfg>(parsed);
    CHECK(parsed.globals.config_name == "deploy.conf");
  }

  SUBCASE("remote host override") {
    auto const parsed{ parse({ "--remote", "staging.example.com", "migrate" }) };
    CHECK(require_cfg<shipit::cmd_deploy::cfg>(parsed).target == "migrate");
    REQUIRE(parsed.globals.remote_host.has_value());
    CHECK(*parsed.globals.remote_host == "staging.example.com");
  }

  SUBCASE("global option after a subcommand") {
    auto const parsed{ parse({ "console", "-r", "other" }) };
    require_cfg<shipit::cmd_console::cfg>(parsed);
    REQUIRE(parsed.globals.remote_host.has_value());
    CHECK(*parsed.globals.remote_host == "other");
  }

  SUBCASE("verbose enables decorated debug logging") {
    auto const parsed{ parse({ "-v" }) };
    require_cfg<shipit::cmd_deploy::cfg>(parsed);
    CHECK(parsed.globals.verbose);
    CHECK(parsed.verbosity == shipit::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }

  SUBCASE("default verbosity") {
    auto const parsed{ parse({ "list" }) };
    CHECK(parsed.verbosity == shipit::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }
}

TEST_CASE("cli_parse: invalid arguments") {
  SUBCASE("unknown option") {
    auto const parsed{ parse({ "--bogus" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
    CHECK_FALSE(parsed.help_requested);
  }

  SUBCASE("more than one target") {
    auto const parsed{ parse({ "deploy", "migrate" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("extra positional after copy") {
    auto const parsed{ parse({ "copy", "a", "b" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("not expected") != std::string::npos);
  }

  SUBCASE("positional after list") {
    auto const parsed{ parse({ "list", "staging" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("staging") != std::string::npos);
  }

  SUBCASE("positional after console") {
    auto const parsed{ parse({ "console", "staging" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("missing option value") {
    auto const parsed{ parse({ "-r" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}
