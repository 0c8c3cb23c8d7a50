#include "local_runner.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("local_runner_run succeeds and streams output") {
  std::vector<std::string> lines;
  bool const ok{ shipit::local_runner_run("echo one\necho two",
                                          [&](std::string_view line) {
                                            lines.emplace_back(line);
                                          }) };
  CHECK(ok);
  CHECK(lines == std::vector<std::string>{ "one", "two" });
}

TEST_CASE("local_runner_run stops at the first failing statement") {
  shipit::test::scoped_temp_dir tmp{ "shipit-local" };
  auto const before{ tmp.path() / "before" };
  auto const after{ tmp.path() / "after" };

  std::string const script{ "touch '" + before.string() + "'\nfalse\ntouch '" +
                            after.string() + "'\n" };

  CHECK_FALSE(shipit::local_runner_run(script));
  CHECK(fs::exists(before));
  CHECK_FALSE(fs::exists(after));
}

TEST_CASE("local_runner_run reports a non-zero exit as failure") {
  CHECK_FALSE(shipit::local_runner_run("exit 3"));
}

TEST_CASE("local_runner_run runs in the caller's working directory") {
  shipit::test::scoped_temp_dir tmp{ "shipit-local" };
  shipit::test::scoped_chdir const cd{ tmp.path() };

  std::vector<std::string> lines;
  CHECK(shipit::local_runner_run("pwd", [&](std::string_view line) {
    lines.emplace_back(line);
  }));
  REQUIRE(lines.size() == 1);
  CHECK(fs::weakly_canonical(lines[0]) == tmp.path());
}

TEST_CASE("local_runner_run reads the caller's stdin") {
  shipit::test::scoped_stdin const input{ "hello\n" };

  std::vector<std::string> lines;
  CHECK(shipit::local_runner_run("read answer\necho got:$answer",
                                 [&](std::string_view line) { lines.emplace_back(line); }));
  CHECK(lines == std::vector<std::string>{ "got:hello" });
}

TEST_CASE("local_runner_run treats an empty script as success") {
  CHECK(shipit::local_runner_run(""));
}
