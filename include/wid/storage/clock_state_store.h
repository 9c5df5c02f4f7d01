#pragma once

#include "wid/core/result.h"

#include <cstdint>
#include <string>

namespace wid::storage {

// ClockState is the persisted clock of one identifier space.
// Plain WIDs store (last_tick, last_seq); HLC-WIDs store (pt, lc).
struct ClockState {
  std::int64_t tick{0};     // NOLINT(readability-identifier-naming)
  std::int64_t counter{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const ClockState&) const = default;
};

enum class CasOutcome {
  kSwapped,       // stored state matched expected and was replaced
  kConflict,      // another writer changed the state first; reload and retry
  kBackendError,  // store unavailable or failed
};

struct CasResult {
  CasOutcome outcome;         // NOLINT(readability-identifier-naming)
  std::string error_message;  // NOLINT(readability-identifier-naming)
};

// IClockStateStore is the atomic compare-and-swap primitive that lets several
// processes share one sequence space. Generators never call it; the allocator
// in shared_allocator.h drives it around state()/restore_state().
class IClockStateStore {
 public:
  virtual ~IClockStateStore() = default;

  // Insert initial for key unless a row already exists.
  [[nodiscard]] virtual core::Result<bool, std::string> ensure(const std::string& key,
                                                               const ClockState& initial) = 0;

  [[nodiscard]] virtual core::Result<ClockState, std::string> load(const std::string& key) = 0;

  // Replace the state for key with desired only if it still equals expected.
  [[nodiscard]] virtual CasResult compare_and_swap(const std::string& key,
                                                   const ClockState& expected,
                                                   const ClockState& desired) = 0;

 protected:
  IClockStateStore() = default;
  IClockStateStore(const IClockStateStore&) = default;
  IClockStateStore& operator=(const IClockStateStore&) = default;
  IClockStateStore(IClockStateStore&&) = default;
  IClockStateStore& operator=(IClockStateStore&&) = default;
};

}  // namespace wid::storage
