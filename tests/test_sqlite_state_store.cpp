#include "wid/storage/shared_allocator.h"
#include "wid/storage/sqlite/sqlite_clock_state_store.h"
#include "wid/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

using namespace wid;

TEST_CASE("SqliteDb applies schema v1", "[storage][sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);

  SECTION("applying the schema twice is a no-op") {
    REQUIRE(db->ensure_schema_v1().has_value());
    CHECK(db->get_schema_version() == 1);
  }
}

TEST_CASE("SqliteClockStateStore ensure, load and compare_and_swap", "[storage][sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  storage::sqlite::SqliteClockStateStore store(db);
  const std::string key = storage::state_key(storage::IdKind::kWid, 4, 0, core::TimeUnit::kSec);

  SECTION("load before ensure reports a missing key") {
    auto loaded = store.load(key);
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error() == "State key not found: " + key);
  }

  SECTION("ensure inserts once and never overwrites") {
    REQUIRE(store.ensure(key, {0, -1}).has_value());
    REQUIRE(store.ensure(key, {7, 7}).has_value());

    auto loaded = store.load(key);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value() == storage::ClockState{0, -1});
  }

  SECTION("a stale expected state is a conflict") {
    REQUIRE(store.ensure(key, {0, -1}).has_value());
    CHECK(store.compare_and_swap(key, {0, -1}, {1735689600, 0}).outcome ==
          storage::CasOutcome::kSwapped);
    CHECK(store.compare_and_swap(key, {0, -1}, {1735689600, 1}).outcome ==
          storage::CasOutcome::kConflict);

    auto loaded = store.load(key);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value() == storage::ClockState{1735689600, 0});
  }
}

TEST_CASE("Two connections to one database file share a sequence space", "[storage][sqlite]") {
  const auto path = std::filesystem::temp_directory_path() / "wid_test_shared_state.db";
  std::filesystem::remove(path);

  {
    auto db_a = storage::sqlite::SqliteDb::open(path.string());
    auto db_b = storage::sqlite::SqliteDb::open(path.string());
    REQUIRE(db_a.has_value());
    REQUIRE(db_b.has_value());
    REQUIRE(db_a.value()->ensure_schema_v1().has_value());
    REQUIRE(db_b.value()->ensure_schema_v1().has_value());

    storage::sqlite::SqliteClockStateStore store_a(db_a.value());
    storage::sqlite::SqliteClockStateStore store_b(db_b.value());
    const std::string key = storage::state_key(storage::IdKind::kWid, 4, 0, core::TimeUnit::kSec);

    std::string previous;
    for (int i = 0; i < 20; ++i) {
      auto& store = (i % 2 == 0) ? store_a : store_b;
      auto id = storage::allocate_next_wid(store, key, 4, 0, core::TimeUnit::kSec);
      REQUIRE(id.has_value());
      CHECK(id.value() > previous);
      previous = id.value();
    }
  }

  std::filesystem::remove(path);
}
