#include "target.h"

#include "doctest.h"

#include <string>
#include <utility>
#include <vector>

namespace {

shipit::config_document make_doc(std::vector<shipit::config_section> sections) {
  shipit::config_document doc;
  doc.path = "test.shipit";
  doc.header = { { "host", "h" }, { "path", "/p" } };
  doc.sections = std::move(sections);
  return doc;
}

}  // namespace

TEST_CASE("target_resolve populates both phases") {
  auto const doc{ make_doc({
      { .name = "x", .is_local = false, .body = "remote one\nremote two" },
      { .name = "x", .is_local = true, .body = "local one" },
  }) };

  auto const t{ shipit::target_resolve(doc, "x") };
  CHECK(t.name == "x");
  REQUIRE(t.local_script.has_value());
  REQUIRE(t.remote_script.has_value());
  CHECK(*t.local_script == "local one");
  CHECK(*t.remote_script == "remote one\nremote two");
  CHECK(t.exists());
}

TEST_CASE("target_resolve with a single phase") {
  auto const doc{ make_doc({
      { .name = "migrate", .is_local = false, .body = "php artisan migrate" },
      { .name = "build", .is_local = true, .body = "make" },
  }) };

  SUBCASE("remote only") {
    auto const t{ shipit::target_resolve(doc, "migrate") };
    CHECK_FALSE(t.local_script.has_value());
    REQUIRE(t.remote_script.has_value());
    CHECK(*t.remote_script == "php artisan migrate");
  }

  SUBCASE("local only") {
    auto const t{ shipit::target_resolve(doc, "build") };
    REQUIRE(t.local_script.has_value());
    CHECK_FALSE(t.remote_script.has_value());
  }
}

TEST_CASE("target_resolve for an unknown target has no scripts") {
  auto const doc{ make_doc({ { .name = "deploy", .is_local = false, .body = "ls" } }) };

  auto const t{ shipit::target_resolve(doc, "staging") };
  CHECK_FALSE(t.exists());
  CHECK_FALSE(shipit::target_exists(doc, "staging"));
  CHECK(shipit::target_exists(doc, "deploy"));
}

TEST_CASE("target names are case-sensitive") {
  auto const doc{ make_doc({ { .name = "Deploy", .is_local = false, .body = "ls" } }) };
  CHECK_FALSE(shipit::target_exists(doc, "deploy"));
  CHECK(shipit::target_exists(doc, "Deploy"));
}

TEST_CASE("target_resolve keeps an empty body as present") {
  auto const doc{ make_doc({ { .name = "noop", .is_local = false, .body = "" } }) };
  auto const t{ shipit::target_resolve(doc, "noop") };
  REQUIRE(t.remote_script.has_value());
  CHECK(t.remote_script->empty());
}

TEST_CASE("target_list returns unique base names in first-seen order") {
  auto const doc{ make_doc({
      { .name = "a", .is_local = false, .body = "" },
      { .name = "a", .is_local = true, .body = "" },
      { .name = "b", .is_local = false, .body = "" },
  }) };
  CHECK(shipit::target_list(doc) == std::vector<std::string>{ "a", "b" });
}

TEST_CASE("target_list orders by first appearance of either variant") {
  auto const doc{ make_doc({
      { .name = "deploy", .is_local = true, .body = "" },
      { .name = "A", .is_local = false, .body = "" },
      { .name = "deploy", .is_local = false, .body = "" },
      { .name = "a", .is_local = false, .body = "" },
  }) };
  CHECK(shipit::target_list(doc) == std::vector<std::string>{ "deploy", "A", "a" });
}

TEST_CASE("target_list of a document without sections is empty") {
  CHECK(shipit::target_list(make_doc({})).empty());
}
