#pragma once

#include "wid/storage/clock_state_store.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace wid::storage::redis {

// RedisClockStateStore keeps each state key as a hash:
//   <key> -> { last_tick: int, last_seq: int }
//
// ensure() and compare_and_swap() are Lua scripts, so the existence check and
// the read-compare-write run atomically on the server.
class RedisClockStateStore final : public IClockStateStore {
 public:
  // Construct with Redis connection string (e.g., "tcp://127.0.0.1:6379")
  // Throws std::runtime_error if connection fails
  explicit RedisClockStateStore(const std::string& redis_uri);

  ~RedisClockStateStore() override;

  RedisClockStateStore(const RedisClockStateStore&) = delete;
  RedisClockStateStore& operator=(const RedisClockStateStore&) = delete;
  RedisClockStateStore(RedisClockStateStore&&) = delete;
  RedisClockStateStore& operator=(RedisClockStateStore&&) = delete;

  [[nodiscard]] core::Result<bool, std::string> ensure(const std::string& key,
                                                       const ClockState& initial) override;
  [[nodiscard]] core::Result<ClockState, std::string> load(const std::string& key) override;
  [[nodiscard]] CasResult compare_and_swap(const std::string& key, const ClockState& expected,
                                           const ClockState& desired) override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;

  std::string ensure_script_sha_;
  std::string cas_script_sha_;

  void load_scripts();
};

}  // namespace wid::storage::redis
