#include "wid/id/grammar.h"
#include "wid/id/timestamp.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace wid;

namespace {

// 2025-01-01T00:00:00Z
constexpr std::int64_t kNewYear2025 = 1735689600;

}  // namespace

TEST_CASE("Timestamp codec renders ticks in UTC", "[grammar][timestamp]") {
  CHECK(id::format_tick(kNewYear2025, core::TimeUnit::kSec) == "20250101T000000");
  CHECK(id::format_tick(kNewYear2025 * 1000 + 7, core::TimeUnit::kMs) == "20250101T000000007");
  CHECK(id::format_tick(0, core::TimeUnit::kSec) == "19700101T000000");
  CHECK(id::format_tick(951825599, core::TimeUnit::kSec) == "20000229T115959");

  const auto ts = id::decode_timestamp("20250101", "000000007", core::TimeUnit::kMs);
  REQUIRE(ts.has_value());
  CHECK(core::to_unix_millis(ts.value()) == kNewYear2025 * 1000 + 7);
  CHECK(id::format_rfc3339(ts.value(), core::TimeUnit::kMs) == "2025-01-01T00:00:00.007+00:00");
  CHECK(id::format_rfc3339(ts.value(), core::TimeUnit::kSec) == "2025-01-01T00:00:00+00:00");
}

TEST_CASE("parse_wid decodes every field", "[grammar][wid]") {
  const auto parsed = id::parse_wid("20250101T000000.0042Z-0a1b2c", 4, 6);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().raw == "20250101T000000.0042Z-0a1b2c");
  CHECK(parsed.value().sequence == 42);
  CHECK(parsed.value().padding == "0a1b2c");
  CHECK(parsed.value().timestamp_sec() == kNewYear2025);
  CHECK(parsed.value().timestamp_millis() == kNewYear2025 * 1000);

  SECTION("padding block is optional") {
    const auto bare = id::parse_wid("20250101T000000.0042Z", 4, 6);
    REQUIRE(bare.has_value());
    CHECK_FALSE(bare.value().padding.has_value());
  }

  SECTION("millisecond unit carries three extra time digits") {
    const auto ms = id::parse_wid("20250101T000000123.0000Z", 4, 0, core::TimeUnit::kMs);
    REQUIRE(ms.has_value());
    CHECK(ms.value().timestamp_millis() == kNewYear2025 * 1000 + 123);
    CHECK_FALSE(id::validate_wid("20250101T000000123.0000Z", 4, 0, core::TimeUnit::kSec));
  }
}

TEST_CASE("parse_wid rejects malformed input", "[grammar][wid]") {
  SECTION("W = 0 is invalid for every operation") {
    const auto r = id::parse_wid("20250101T000000.0000Z", 0, 0);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::WidError::kInvalidW);
  }

  SECTION("W beyond 18 digits is invalid") {
    CHECK(id::parse_wid("20250101T000000.0000Z", 19, 0).error() == core::WidError::kInvalidW);
  }

  SECTION("sequence width must equal W") {
    CHECK_FALSE(id::validate_wid("20250101T000000.000Z", 4, 0));
    CHECK_FALSE(id::validate_wid("20250101T000000.00000Z", 4, 0));
  }

  SECTION("uppercase padding is rejected") {
    CHECK_FALSE(id::validate_wid("20250101T000000.0000Z-ABCDEF", 4, 6));
    CHECK(id::validate_wid("20250101T000000.0000Z-abcdef", 4, 6));
  }

  SECTION("padding is not part of the grammar when Z = 0") {
    CHECK_FALSE(id::validate_wid("20250101T000000.0000Z-abcdef", 4, 0));
  }

  SECTION("padding width must equal Z") {
    CHECK_FALSE(id::validate_wid("20250101T000000.0000Z-abc", 4, 6));
  }

  SECTION("grammar mismatch reports kInvalidFormat") {
    CHECK(id::parse_wid("not-a-wid", 4, 6).error() == core::WidError::kInvalidFormat);
    CHECK(id::parse_wid("", 4, 6).error() == core::WidError::kInvalidFormat);
    CHECK(id::parse_wid(" 20250101T000000.0000Z", 4, 6).error() == core::WidError::kInvalidFormat);
  }

  SECTION("illegal calendar values report kInvalidTimestamp") {
    CHECK(id::parse_wid("20251301T000000.0000Z", 4, 6).error() ==
          core::WidError::kInvalidTimestamp);
    CHECK(id::parse_wid("20250230T000000.0000Z", 4, 6).error() ==
          core::WidError::kInvalidTimestamp);
    CHECK(id::parse_wid("20250101T240000.0000Z", 4, 6).error() ==
          core::WidError::kInvalidTimestamp);
    CHECK(id::parse_wid("20250101T006000.0000Z", 4, 6).error() ==
          core::WidError::kInvalidTimestamp);
  }

  SECTION("format errors win over calendar errors") {
    CHECK(id::parse_wid("20251301T000000.000Z", 4, 6).error() == core::WidError::kInvalidFormat);
  }
}

TEST_CASE("parse_hlc_wid decodes node and counter", "[grammar][hlc]") {
  const auto parsed = id::parse_hlc_wid("20250101T000000.0007Z-node_01", 4, 0);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().logical_counter == 7);
  CHECK(parsed.value().node == "node_01");
  CHECK_FALSE(parsed.value().padding.has_value());

  const auto padded = id::parse_hlc_wid("20250101T000000.0007Z-n1-00ff00", 4, 6);
  REQUIRE(padded.has_value());
  CHECK(padded.value().node == "n1");
  CHECK(padded.value().padding == "00ff00");
}

TEST_CASE("parse_hlc_wid rejects malformed input", "[grammar][hlc]") {
  CHECK(id::parse_hlc_wid("20250101T000000.0000Z-node", 0, 0).error() == core::WidError::kInvalidW);

  SECTION("node containing a hyphen") {
    CHECK_FALSE(id::validate_hlc_wid("20250101T000000.0000Z-node-1", 4, 0));
    CHECK_FALSE(id::validate_hlc_wid("20250101T000000.0000Z-node-1", 4, 6));
  }

  SECTION("node is mandatory") {
    CHECK(id::parse_hlc_wid("20250101T000000.0000Z", 4, 0).error() ==
          core::WidError::kInvalidFormat);
    CHECK_FALSE(id::validate_hlc_wid("20250101T000000.0000Z-", 4, 0));
  }

  SECTION("illegal calendar value") {
    CHECK(id::parse_hlc_wid("20250132T000000.0000Z-n", 4, 0).error() ==
          core::WidError::kInvalidTimestamp);
  }
}

TEST_CASE("Node validation", "[grammar][hlc]") {
  CHECK(id::is_valid_node("abc_XYZ_09"));
  CHECK_FALSE(id::is_valid_node(""));
  CHECK_FALSE(id::is_valid_node("a-b"));
  CHECK_FALSE(id::is_valid_node("a b"));
  CHECK_FALSE(id::is_valid_node("nöde"));
}

TEST_CASE("Digit width limits", "[grammar]") {
  CHECK(id::max_counter(1) == 9);
  CHECK(id::max_counter(4) == 9999);
  CHECK(id::max_counter(18) == 999999999999999999);
  CHECK_FALSE(id::is_valid_digit_width(0));
  CHECK(id::is_valid_digit_width(18));
  CHECK_FALSE(id::is_valid_digit_width(19));
}

TEST_CASE("Non-default parameters are served from the pattern cache", "[grammar]") {
  // Same triple twice exercises the cached path.
  for (int i = 0; i < 2; ++i) {
    CHECK(id::validate_wid("20250101T000000.12Z-abc", 2, 3));
    CHECK(id::validate_hlc_wid("20250101T000000000.12Z-n-abc", 2, 3, core::TimeUnit::kMs));
  }
}
