#include "wid/core/clock.h"

#include <chrono>

namespace wid::core {

std::int64_t SystemClock::now_ticks(const TimeUnit unit) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  if (unit == TimeUnit::kMs) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::int64_t FixedClock::now_ticks(const TimeUnit unit) {
  if (unit == TimeUnit::kMs) {
    return unix_millis_;
  }
  // Floor, so pre-epoch instants still map to the containing second.
  const std::int64_t q = unix_millis_ / 1000;
  return (unix_millis_ % 1000 < 0) ? q - 1 : q;
}

}  // namespace wid::core
