#pragma once

#include "wid/core/clock.h"
#include "wid/core/padding.h"
#include "wid/core/result.h"
#include "wid/core/time_unit.h"
#include "wid/storage/clock_state_store.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wid::storage {

enum class IdKind {
  kWid,
  kHlc,
};

[[nodiscard]] std::string to_string(IdKind kind);
[[nodiscard]] std::optional<IdKind> parse_id_kind(std::string_view text);

inline constexpr int kDefaultMaxAttempts = 64;

// Store key for one shared identifier space:
//   plain: "wid:cpp:<W>:<Z>:<unit>"
//   hlc:   "wid:cpp:hlc:<W>:<Z>:<unit>"
[[nodiscard]] std::string state_key(IdKind kind, int w, std::size_t z, core::TimeUnit unit);

using AllocationResult = core::Result<std::string, std::string>;

// allocate_next_wid issues one plain WID from a sequence space shared through
// store: load the state, advance a generator restored to it, and publish the
// new state with compare-and-swap. A conflict reloads and retries; after
// max_attempts conflicts it fails with "allocation contention: retry budget
// exhausted". Backend errors fail immediately.
[[nodiscard]] AllocationResult allocate_next_wid(
    IClockStateStore& store, const std::string& key, int w, std::size_t z, core::TimeUnit unit,
    std::shared_ptr<core::ITickClock> clock = nullptr,
    std::shared_ptr<core::IPaddingSource> padding = nullptr, int max_attempts = kDefaultMaxAttempts);

// Same loop over the HLC (pt, lc) pair; the initial state is (0, 0).
[[nodiscard]] AllocationResult allocate_next_hlc_wid(
    IClockStateStore& store, const std::string& key, const std::string& node, int w,
    std::size_t z, core::TimeUnit unit, std::shared_ptr<core::ITickClock> clock = nullptr,
    std::shared_ptr<core::IPaddingSource> padding = nullptr, int max_attempts = kDefaultMaxAttempts);

}  // namespace wid::storage
