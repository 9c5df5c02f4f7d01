#include "wid/storage/inmemory_clock_state_store.h"

namespace wid::storage {

core::Result<bool, std::string> InMemoryClockStateStore::ensure(const std::string& key,
                                                                const ClockState& initial) {
  std::lock_guard<std::mutex> lock(mutex_);
  states_.try_emplace(key, initial);
  return core::Result<bool, std::string>::ok(true);
}

core::Result<ClockState, std::string> InMemoryClockStateStore::load(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(key);
  if (it == states_.end()) {
    return core::Result<ClockState, std::string>::err("State key not found: " + key);
  }
  return core::Result<ClockState, std::string>::ok(it->second);
}

CasResult InMemoryClockStateStore::compare_and_swap(const std::string& key,
                                                    const ClockState& expected,
                                                    const ClockState& desired) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(key);
  if (it == states_.end()) {
    return CasResult{CasOutcome::kBackendError, "State key not found: " + key};
  }
  if (it->second != expected) {
    return CasResult{CasOutcome::kConflict, ""};
  }
  it->second = desired;
  return CasResult{CasOutcome::kSwapped, ""};
}

}  // namespace wid::storage
