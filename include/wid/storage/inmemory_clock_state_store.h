#pragma once

#include "wid/storage/clock_state_store.h"

#include <map>
#include <mutex>
#include <string>

namespace wid::storage {

// InMemoryClockStateStore shares state between threads of one process.
class InMemoryClockStateStore final : public IClockStateStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> ensure(const std::string& key,
                                                       const ClockState& initial) override;
  [[nodiscard]] core::Result<ClockState, std::string> load(const std::string& key) override;
  [[nodiscard]] CasResult compare_and_swap(const std::string& key, const ClockState& expected,
                                           const ClockState& desired) override;

 private:
  std::mutex mutex_;
  std::map<std::string, ClockState> states_;
};

}  // namespace wid::storage
