#include "wid/core/clock.h"
#include "wid/id/hlc_generator.h"
#include "wid/id/id_stream.h"
#include "wid/id/wid_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace wid;

TEST_CASE("stream_ids emits exactly count identifiers in order", "[stream]") {
  auto clock = std::make_shared<core::FixedClock>(1735689600000);
  auto gen = id::WidGen::create(4, 0, core::TimeUnit::kSec, clock);
  REQUIRE(gen.has_value());

  std::vector<std::string> out;
  const auto emitted = id::stream_ids(gen.value(), 5, [&out](const std::string& wid) {
    out.push_back(wid);
    return true;
  });

  CHECK(emitted == 5);
  REQUIRE(out.size() == 5);
  CHECK(out.front() == "20250101T000000.0000Z");
  CHECK(out.back() == "20250101T000000.0004Z");
}

TEST_CASE("stream_ids with count 0 runs until the sink cancels", "[stream]") {
  auto gen = id::HlcWidGen::create("streamer", 4, 6);
  REQUIRE(gen.has_value());

  std::vector<std::string> out;
  const auto emitted = id::stream_ids(gen.value(), 0, [&out](const std::string& wid) {
    out.push_back(wid);
    return out.size() < 1000;
  });

  CHECK(emitted == 1000);
  for (std::size_t i = 1; i < out.size(); ++i) {
    CHECK(out[i] > out[i - 1]);
  }

  SECTION("the generator keeps its state after cancellation") {
    const std::string next = gen.value().next();
    CHECK(next > out.back());
  }
}
