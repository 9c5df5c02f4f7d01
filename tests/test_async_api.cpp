#include "wid/id/async_api.h"
#include "wid/id/grammar.h"

#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <string>
#include <vector>

using namespace wid;

TEST_CASE("Async helpers produce valid identifiers", "[async]") {
  SECTION("single plain id") {
    auto result = id::async_next_wid(4, 6).get();
    REQUIRE(result.has_value());
    CHECK(id::validate_wid(result.value(), 4, 6));
  }

  SECTION("single hlc id") {
    auto result = id::async_next_hlc_wid("async_node", 4, 0, core::TimeUnit::kMs).get();
    REQUIRE(result.has_value());
    const auto parsed = id::parse_hlc_wid(result.value(), 4, 0, core::TimeUnit::kMs);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().node == "async_node");
  }

  SECTION("construction errors propagate through the future") {
    auto bad_w = id::async_next_wid(0, 6).get();
    REQUIRE_FALSE(bad_w.has_value());
    CHECK(bad_w.error() == core::WidError::kInvalidW);

    auto bad_node = id::async_next_hlc_wid("bad-node", 4, 0).get();
    REQUIRE_FALSE(bad_node.has_value());
    CHECK(bad_node.error() == core::WidError::kInvalidNode);
  }

  SECTION("streams deliver count ids from the worker thread") {
    std::mutex mutex;
    std::vector<std::string> out;
    auto sink = [&mutex, &out](const std::string& wid) {
      std::lock_guard<std::mutex> lock(mutex);
      out.push_back(wid);
      return true;
    };

    auto plain = id::async_wid_stream(4, 6, core::TimeUnit::kSec, 50, sink).get();
    REQUIRE(plain.has_value());
    CHECK(plain.value() == 50);

    auto hlc = id::async_hlc_wid_stream("n", 4, 0, core::TimeUnit::kSec, 25, sink).get();
    REQUIRE(hlc.has_value());
    CHECK(hlc.value() == 25);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(out.size() == 75);
    for (std::size_t i = 1; i < 50; ++i) {
      CHECK(out[i] > out[i - 1]);
    }
  }

  SECTION("independent async generators never share state") {
    auto f1 = id::async_next_hlc_wid("a", 4, 6);
    auto f2 = id::async_next_hlc_wid("b", 4, 6);
    const auto r1 = f1.get();
    const auto r2 = f2.get();
    REQUIRE(r1.has_value());
    REQUIRE(r2.has_value());
    CHECK(r1.value() != r2.value());
  }
}
