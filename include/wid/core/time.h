#pragma once

#include <chrono>
#include <cstdint>

namespace wid::core {

using Clock = std::chrono::system_clock;
// Decoded identifier timestamps never carry more than millisecond precision.
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline std::int64_t to_unix_seconds(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

}  // namespace wid::core
