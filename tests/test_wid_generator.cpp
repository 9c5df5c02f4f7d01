#include "wid/core/clock.h"
#include "wid/core/padding.h"
#include "wid/id/grammar.h"
#include "wid/id/timestamp.h"
#include "wid/id/wid_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <memory>
#include <set>
#include <string>

using namespace wid;

namespace {

constexpr std::int64_t kNewYear2025 = 1735689600;

struct Fixture {
  std::shared_ptr<core::FixedClock> clock =
      std::make_shared<core::FixedClock>(kNewYear2025 * 1000);
  std::shared_ptr<core::FixedPaddingSource> padding =
      std::make_shared<core::FixedPaddingSource>("0123456789abcdef");

  id::WidGen make(const int w, const std::size_t z,
                  const core::TimeUnit unit = core::TimeUnit::kSec) {
    auto gen = id::WidGen::create(w, z, unit, clock, padding);
    REQUIRE(gen.has_value());
    return std::move(gen.value());
  }
};

}  // namespace

TEST_CASE("WidGen rejects invalid digit widths", "[wid][generator]") {
  CHECK(id::WidGen::create(0, 6).error() == core::WidError::kInvalidW);
  CHECK(id::WidGen::create(-3, 6).error() == core::WidError::kInvalidW);
  CHECK(id::WidGen::create(19, 0).error() == core::WidError::kInvalidW);
  CHECK(id::WidGen::create(18, 0).has_value());
}

TEST_CASE("WidGen renders the expected layout", "[wid][generator]") {
  Fixture f;
  auto gen = f.make(4, 6);

  CHECK(gen.next() == "20250101T000000.0000Z-012345");
  CHECK(gen.next() == "20250101T000000.0001Z-012345");

  f.clock->advance_millis(1000);
  CHECK(gen.next() == "20250101T000001.0000Z-012345");

  SECTION("Z = 0 omits the padding block") {
    auto bare = f.make(3, 0);
    CHECK(bare.next() == "20250101T000001.000Z");
  }

  SECTION("millisecond unit") {
    f.clock->set_millis(kNewYear2025 * 1000 + 42);
    auto ms = f.make(2, 0, core::TimeUnit::kMs);
    CHECK(ms.next() == "20250101T000000042.00Z");
  }
}

TEST_CASE("WidGen output is strictly increasing", "[wid][generator]") {
  SECTION("stalled clock") {
    Fixture f;
    auto gen = f.make(4, 6);
    std::string prev = gen.next();
    for (int i = 0; i < 500; ++i) {
      const std::string cur = gen.next();
      CHECK(cur > prev);
      prev = cur;
    }
  }

  SECTION("clock stepping backwards") {
    Fixture f;
    auto gen = f.make(4, 0);
    const std::string before = gen.next();
    f.clock->advance_millis(-60000);
    const std::string after = gen.next();
    CHECK(after > before);
    CHECK(after == "20250101T000000.0001Z");
    CHECK(gen.state().last_tick == kNewYear2025);
  }

  SECTION("system clock") {
    auto gen = id::WidGen::create_default();
    std::set<std::string> seen;
    std::string prev = gen.next();
    seen.insert(prev);
    for (int i = 0; i < 2000; ++i) {
      const std::string cur = gen.next();
      CHECK(cur > prev);
      CHECK(id::validate_wid(cur, 4, 6));
      seen.insert(cur);
      prev = cur;
    }
    CHECK(seen.size() == 2001);
  }
}

TEST_CASE("WidGen rolls over to the next tick when the sequence is exhausted",
          "[wid][generator][rollover]") {
  Fixture f;
  auto gen = f.make(1, 0);

  for (int i = 0; i < 10; ++i) {
    CHECK(gen.next() == "20250101T000000." + std::to_string(i) + "Z");
  }
  CHECK(gen.state() == id::WidState{kNewYear2025, 9});

  // The 11th id in the same wall-clock second forces a synthetic tick.
  CHECK(gen.next() == "20250101T000001.0Z");
  CHECK(gen.state() == id::WidState{kNewYear2025 + 1, 0});

  // Still inside the real second: the synthetic tick keeps absorbing ids.
  for (int i = 1; i < 10; ++i) {
    CHECK(gen.next() == "20250101T000001." + std::to_string(i) + "Z");
  }
  CHECK(gen.next() == "20250101T000002.0Z");

  // Exactly one tick advance per 10^W ids, and no sequence ever exceeds 9.
  const auto ids = gen.next_n(25);
  for (const auto& wid : ids) {
    const auto parsed = id::parse_wid(wid, 1, 0);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().sequence <= 9);
  }
  CHECK(gen.state().last_tick == kNewYear2025 + 4);
}

TEST_CASE("WidGen state can be saved and restored", "[wid][generator][state]") {
  Fixture f;
  auto first = f.make(4, 0);
  (void)first.next_n(3);
  const id::WidState saved = first.state();
  CHECK(saved == id::WidState{kNewYear2025, 2});

  auto second = f.make(4, 0);
  CHECK(second.state() == id::WidState{0, -1});
  REQUIRE(second.restore_state(saved.last_tick, saved.last_seq).has_value());
  CHECK(second.next() == "20250101T000000.0003Z");
}

TEST_CASE("WidGen restore_state bounds the persisted state", "[wid][generator][state]") {
  Fixture f;
  auto gen = f.make(4, 0);

  SECTION("a sequence above 10^W - 1 rolls into the next tick") {
    REQUIRE(gen.restore_state(kNewYear2025, std::numeric_limits<std::int64_t>::max()).has_value());
    CHECK(gen.state() == id::WidState{kNewYear2025, 9999});
    CHECK(gen.next() == "20250101T000001.0000Z");
    CHECK(gen.next() == "20250101T000001.0001Z");
  }

  SECTION("a sequence exactly at 10^W - 1 rolls into the next tick") {
    REQUIRE(gen.restore_state(kNewYear2025, 9999).has_value());
    CHECK(gen.next() == "20250101T000001.0000Z");
  }

  SECTION("out-of-range state is rejected and leaves the generator untouched") {
    CHECK(gen.restore_state(-1, 0).error() == core::WidError::kInvalidState);
    CHECK(gen.restore_state(kNewYear2025, -2).error() == core::WidError::kInvalidState);
    CHECK(gen.restore_state(id::max_tick(core::TimeUnit::kSec) + 1, 0).error() ==
          core::WidError::kInvalidState);
    CHECK(gen.restore_state(std::numeric_limits<std::int64_t>::max(), 0).error() ==
          core::WidError::kInvalidState);
    CHECK(gen.state() == id::WidState{0, -1});
  }
}

TEST_CASE("WidGen round trips through parse_wid", "[wid][generator]") {
  for (const auto unit : {core::TimeUnit::kSec, core::TimeUnit::kMs}) {
    for (const int w : {1, 4, 9}) {
      for (const std::size_t z : {std::size_t{0}, std::size_t{6}}) {
        auto gen = id::WidGen::create(w, z, unit);
        REQUIRE(gen.has_value());
        CHECK(gen.value().digit_width() == w);
        CHECK(gen.value().padding_width() == z);
        CHECK(gen.value().time_unit() == unit);

        const std::string wid = gen.value().next();
        const auto parsed = id::parse_wid(wid, w, z, unit);
        REQUIRE(parsed.has_value());
        CHECK(parsed.value().sequence == gen.value().state().last_seq);
        CHECK(parsed.value().padding.has_value() == (z > 0));
      }
    }
  }
}
