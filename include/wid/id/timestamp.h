#pragma once

#include "wid/core/time.h"
#include "wid/core/time_unit.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wid::id {

// format_tick renders a tick as the identifier timestamp block.
//   kSec: YYYYMMDDTHHMMSS       (tick = seconds since epoch)
//   kMs:  YYYYMMDDTHHMMSSmmm    (tick = milliseconds since epoch)
// Always UTC. The rendering is the exact inverse of decode_timestamp.
[[nodiscard]] std::string format_tick(std::int64_t tick, core::TimeUnit unit);

// Last tick whose timestamp still fits the four-digit year of the grammar
// (9999-12-31T23:59:59[.999] UTC).
[[nodiscard]] constexpr std::int64_t max_tick(const core::TimeUnit unit) {
  constexpr std::int64_t kLastSecond = 253402300799;
  return unit == core::TimeUnit::kMs ? kLastSecond * 1000 + 999 : kLastSecond;
}

// decode_timestamp interprets the 8 date digits and the 6 or 9 time digits
// captured by the grammar. Returns nullopt when they do not form a legal
// calendar date-time (month 13, Feb 30, hour 24, ...).
[[nodiscard]] std::optional<core::Timestamp> decode_timestamp(std::string_view date_digits,
                                                              std::string_view time_digits,
                                                              core::TimeUnit unit);

// format_rfc3339 renders a decoded timestamp for display:
// YYYY-MM-DDTHH:MM:SS+00:00, with .mmm before the offset in ms mode.
[[nodiscard]] std::string format_rfc3339(core::Timestamp ts, core::TimeUnit unit);

}  // namespace wid::id
