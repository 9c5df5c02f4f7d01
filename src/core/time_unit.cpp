#include "wid/core/time_unit.h"

namespace wid::core {

std::string_view to_string(const TimeUnit unit) {
  return unit == TimeUnit::kMs ? "ms" : "sec";
}

std::optional<TimeUnit> parse_time_unit(const std::string_view text) {
  if (text == "sec") {
    return TimeUnit::kSec;
  }
  if (text == "ms") {
    return TimeUnit::kMs;
  }
  return std::nullopt;
}

}  // namespace wid::core
