#include "tui.h"

#include "doctest.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(shipit::tui::init(), std::logic_error);
}

TEST_CASE("tui allows handler changes while idle") {
  CHECK_NOTHROW(shipit::tui::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(shipit::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(shipit::tui::set_output_handler(handler));
  CHECK_NOTHROW(shipit::tui::run(shipit::tui::level::TUI_INFO));
  CHECK_NOTHROW(shipit::tui::shutdown());

  CHECK_NOTHROW(shipit::tui::run(std::nullopt));
  CHECK_THROWS_AS(shipit::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(shipit::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(shipit::tui::shutdown());
  CHECK_THROWS_AS(shipit::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(shipit::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    // Other tests log without a running worker; drain their backlog first.
    shipit::tui::set_output_handler([](std::string_view) {});
    shipit::tui::run(std::nullopt);
    shipit::tui::shutdown();

    shipit::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      shipit::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(shipit::tui::run(std::nullopt));

  shipit::tui::debug("hello %s", "world");
  shipit::tui::info("value %d", 42);
  shipit::tui::warn("three %d", 3);
  shipit::tui::error("boom");

  CHECK_NOTHROW(shipit::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(shipit::tui::run(shipit::tui::level::TUI_DEBUG, true));
  shipit::tui::info("structured %d", 7);
  CHECK_NOTHROW(shipit::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.starts_with("["));
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.ends_with("structured 7\n"));
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(shipit::tui::run(shipit::tui::level::TUI_WARN, true));
  shipit::tui::debug("debug");
  shipit::tui::info("info");
  shipit::tui::warn("warn");
  shipit::tui::error("error");
  CHECK_NOTHROW(shipit::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);

  messages.clear();
  CHECK_NOTHROW(shipit::tui::run(shipit::tui::level::TUI_INFO, true));
  shipit::tui::debug("debug");
  shipit::tui::info("info");
  CHECK_NOTHROW(shipit::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("INF") != std::string::npos);
  CHECK(messages[0].find("info") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui header is plain text when captured") {
  CHECK_NOTHROW(shipit::tui::run(shipit::tui::level::TUI_INFO));
  shipit::tui::header("Running remote script at %s:%s...", "host", "/srv");
  CHECK_NOTHROW(shipit::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "Running remote script at host:/srv...\n");
}

TEST_CASE_FIXTURE(captured_output, "tui formats long messages") {
  std::string const long_value(5000, 'x');
  CHECK_NOTHROW(shipit::tui::run(std::nullopt));
  shipit::tui::info("%s", long_value.c_str());
  CHECK_NOTHROW(shipit::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == long_value + "\n");
}

TEST_CASE("interactive_mode_guard RAII") {
  { shipit::tui::interactive_mode_guard guard; }

  // Re-acquiring without deadlock means the destructor released the lock
  { shipit::tui::interactive_mode_guard guard2; }
}

TEST_CASE("interactive_mode_guard exception safety") {
  bool exception_thrown{ false };

  try {
    shipit::tui::interactive_mode_guard guard;
    exception_thrown = true;
    throw std::runtime_error{ "test exception" };
  } catch (std::runtime_error const &) {}

  CHECK(exception_thrown);

  { shipit::tui::interactive_mode_guard guard2; }
}
