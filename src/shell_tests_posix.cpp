#if defined(_WIN32)
#error POSIX-only
#endif

#include "shell.h"

#include "test_support.h"

#include "doctest.h"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static std::vector<std::string> run_collect(std::string_view script,
                                            std::optional<fs::path> cwd = std::nullopt,
                                            shipit::shell_env_t env = shipit::shell_getenv()) {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .cwd = cwd,
                             .env = std::move(env),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run(script, inv) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(!result.signal.has_value());
  return lines;
}

TEST_CASE("shell_getenv captures PATH") {
  auto const env{ shipit::shell_getenv() };
  REQUIRE(!env.empty());
  CHECK(env.contains("PATH"));
}

TEST_CASE("shell_run executes multiple lines") {
  auto lines{ run_collect("echo first\nprintf 'second\\n'\n") };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "first");
  CHECK(lines[1] == "second");
}

TEST_CASE("shell_run exposes custom environment variables") {
  auto env{ shipit::shell_getenv() };
  env["SHIPIT_SHELL_TEST"] = "ok";
  auto lines{ run_collect("printf '%s\\n' \"$SHIPIT_SHELL_TEST\"", std::nullopt, env) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "ok");
}

TEST_CASE("shell_run surfaces non-zero exit codes") {
  shipit::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                             .cwd = std::nullopt,
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("exit 7", inv) };
  CHECK(result.exit_code == 7);
  CHECK(!result.signal.has_value());
}

TEST_CASE("shell_run delivers trailing partial lines") {
  auto lines{ run_collect("printf 'without-newline'") };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "without-newline");
}

TEST_CASE("shell_run propagates callback exceptions") {
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [](std::string_view) { throw std::runtime_error("test"); },
                             .cwd = std::nullopt,
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  CHECK_THROWS_AS(shipit::shell_run("echo hi", inv), std::runtime_error);
}

TEST_CASE("shell_run reports signal termination") {
  shipit::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                             .cwd = std::nullopt,
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("kill -TERM $$", inv) };
  CHECK(result.exit_code == (128 + SIGTERM));
  REQUIRE(result.signal.has_value());
  CHECK(*result.signal == SIGTERM);
}

TEST_CASE("shell_run handles empty script") {
  auto lines{ run_collect("") };
  CHECK(lines.empty());
}

TEST_CASE("shell_run respects working directory") {
  shipit::test::scoped_temp_dir tmp{ "shipit-shell" };
  auto const lines{ run_collect("pwd", tmp.path()) };
  REQUIRE(lines.size() == 1);
  CHECK(fs::weakly_canonical(fs::path{ lines[0] }) == tmp.path());
}

TEST_CASE("shell_run handles invalid working directory") {
  shipit::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                             .cwd = "/nonexistent/directory/path",
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("echo hi", inv) };
  CHECK(result.exit_code == 127);
}

TEST_CASE("shell_run delivers split stdout/stderr callbacks") {
  std::vector<std::string> stdout_lines;
  std::vector<std::string> stderr_lines;
  std::vector<std::string> all_lines;
  shipit::shell_run_cfg inv{
    .on_output_line = [&](std::string_view line) { all_lines.emplace_back(line); },
    .on_stdout_line = [&](std::string_view line) { stdout_lines.emplace_back(line); },
    .on_stderr_line = [&](std::string_view line) { stderr_lines.emplace_back(line); },
    .env = shipit::shell_getenv(),
    .shell = shipit::shell_choice::bash,
  };
  auto const result{ shipit::shell_run(
      "printf 'out1\\n'; >&2 printf 'err1\\n'; printf 'out2\\n'; >&2 printf 'err2\\n'",
      inv) };
  REQUIRE(result.exit_code == 0);
  CHECK(stdout_lines == std::vector<std::string>{ "out1", "out2" });
  CHECK(stderr_lines == std::vector<std::string>{ "err1", "err2" });
  CHECK(all_lines.size() == 4);
  auto find_index = [&](std::string const &needle) {
    auto it = std::find(all_lines.begin(), all_lines.end(), needle);
    return static_cast<int>(std::distance(all_lines.begin(), it));
  };
  CHECK(find_index("out1") < find_index("out2"));
  CHECK(find_index("err1") < find_index("err2"));
}

TEST_CASE("shell_run handles large output") {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .cwd = std::nullopt,
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("for i in {1..1000}; do printf '%0100d\\n' $i; done",
                                       inv) };
  REQUIRE(result.exit_code == 0);
  CHECK(lines.size() == 1000);
  CHECK(lines[0].size() == 100);
  CHECK(lines[999].size() == 100);
}

TEST_CASE("shell_run keeps going after a failed statement without set -e") {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::sh };
  auto const result{ shipit::shell_run("echo before\nfalse\necho after", inv) };
  CHECK(result.exit_code == 0);
  CHECK(lines == std::vector<std::string>{ "before", "after" });
}

TEST_CASE("shell_run stops at an explicit exit mid-script") {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("echo line1\nexit 42\necho line2", inv) };
  CHECK(result.exit_code == 42);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "line1");
}

TEST_CASE("shell_run removes its temporary script") {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = shipit::shell_getenv(),
                             .shell = shipit::shell_choice::bash };
  auto const result{ shipit::shell_run("printf '%s\\n' \"$0\"", inv) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(lines.size() == 1);
  CHECK(fs::path{ lines[0] }.filename().string().starts_with("shipit-shell-"));
  CHECK_FALSE(fs::exists(lines[0]));
}

TEST_CASE("process_run executes argv without a shell") {
  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = shipit::shell_getenv() };
  auto const result{ shipit::process_run({ "/bin/sh", "-c", "printf '%s|%s\\n' \"$0\" \"$1\"",
                                           "one two", "it's" },
                                         inv) };
  REQUIRE(result.exit_code == 0);
  CHECK(lines == std::vector<std::string>{ "one two|it's" });
}

TEST_CASE("process_run reports exec failure as exit 127") {
  shipit::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                             .env = shipit::shell_getenv() };
  auto const result{ shipit::process_run({ "/nonexistent/binary/shipit-test" }, inv) };
  CHECK(result.exit_code == 127);
  CHECK_FALSE(result.signal.has_value());
}

TEST_CASE("process_run rejects an empty argv") {
  CHECK_THROWS_AS(shipit::process_run({}, shipit::shell_run_cfg{}), std::invalid_argument);
}

TEST_CASE("process_run in interactive mode returns the child's status") {
  bool called{ false };
  shipit::shell_run_cfg inv{ .on_output_line = [&](std::string_view) { called = true; },
                             .env = shipit::shell_getenv(),
                             .interactive = true };
  auto const result{ shipit::process_run({ "/bin/sh", "-c", "exit 4" }, inv) };
  CHECK(result.exit_code == 4);
  CHECK_FALSE(called);
}

TEST_CASE("process_run piped mode reads stdin only when inherited") {
  shipit::test::scoped_stdin const input{ "from-caller\n" };

  std::vector<std::string> lines;
  shipit::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = shipit::shell_getenv() };
  std::vector<std::string> const argv{ "/bin/sh", "-c", "read line && echo \"$line\"" };

  SUBCASE("default gets an empty stdin") {
    auto const result{ shipit::process_run(argv, inv) };
    CHECK(result.exit_code != 0);
    CHECK(lines.empty());
  }

  SUBCASE("inherit_stdin passes the caller's stdin through") {
    inv.inherit_stdin = true;
    auto const result{ shipit::process_run(argv, inv) };
    CHECK(result.exit_code == 0);
    CHECK(lines == std::vector<std::string>{ "from-caller" });
  }
}
