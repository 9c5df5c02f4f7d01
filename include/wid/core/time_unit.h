#pragma once

#include <optional>
#include <string_view>

namespace wid::core {

// TimeUnit is the tick granularity of a generator: whole seconds or whole
// milliseconds since the Unix epoch.
enum class TimeUnit {
  kSec,  // NOLINT(readability-identifier-naming)
  kMs,   // NOLINT(readability-identifier-naming)
};

// to_string returns the wire spelling: "sec" or "ms".
[[nodiscard]] std::string_view to_string(TimeUnit unit);

// parse_time_unit accepts exactly "sec" or "ms".
[[nodiscard]] std::optional<TimeUnit> parse_time_unit(std::string_view text);

// Number of HHMMSS[mmm] digits rendered for a unit (6 or 9).
[[nodiscard]] constexpr int time_digits(const TimeUnit unit) noexcept {
  return unit == TimeUnit::kMs ? 9 : 6;
}

}  // namespace wid::core
