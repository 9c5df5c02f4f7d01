#include "wid/storage/redis/redis_clock_state_store.h"

#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <iterator>
#include <unordered_map>
#include <vector>

namespace wid::storage::redis {

namespace {

// Args: initial last_tick, initial last_seq
// Returns: 1 if the hash was created, 0 if it already existed
constexpr const char* kEnsureScript = R"LUA(
local key = KEYS[1]
if redis.call('EXISTS', key) == 1 then
  return 0
end
redis.call('HSET', key, 'last_tick', ARGV[1], 'last_seq', ARGV[2])
return 1
)LUA";

// Args: expected last_tick, expected last_seq, desired last_tick, desired last_seq
// Returns: 1=Swapped, 0=Conflict, -1=Missing
constexpr const char* kCompareAndSwapScript = R"LUA(
local key = KEYS[1]
if redis.call('EXISTS', key) == 0 then
  return -1
end
local tick = redis.call('HGET', key, 'last_tick')
local seq = redis.call('HGET', key, 'last_seq')
if tick ~= ARGV[1] or seq ~= ARGV[2] then
  return 0
end
redis.call('HSET', key, 'last_tick', ARGV[3], 'last_seq', ARGV[4])
return 1
)LUA";

}  // namespace

RedisClockStateStore::RedisClockStateStore(const std::string& redis_uri) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    redis_->ping();
    load_scripts();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisClockStateStore::~RedisClockStateStore() = default;

void RedisClockStateStore::load_scripts() {
  ensure_script_sha_ = redis_->script_load(kEnsureScript);
  cas_script_sha_ = redis_->script_load(kCompareAndSwapScript);
}

core::Result<bool, std::string> RedisClockStateStore::ensure(const std::string& key,
                                                             const ClockState& initial) {
  try {
    std::vector<std::string> keys = {key};
    std::vector<std::string> args = {std::to_string(initial.tick),
                                     std::to_string(initial.counter)};
    sw::redis::StringView script_sha{ensure_script_sha_};
    (void)redis_->evalsha<long long>(script_sha, keys.begin(), keys.end(), args.begin(),
                                     args.end());
    return core::Result<bool, std::string>::ok(true);
  } catch (const std::exception& e) {
    return core::Result<bool, std::string>::err("Redis error: " + std::string(e.what()));
  }
}

core::Result<ClockState, std::string> RedisClockStateStore::load(const std::string& key) {
  try {
    std::unordered_map<std::string, std::string> fields;
    redis_->hgetall(key, std::inserter(fields, fields.end()));
    if (fields.empty()) {
      return core::Result<ClockState, std::string>::err("State key not found: " + key);
    }
    ClockState state{
        .tick = std::stoll(fields.at("last_tick")),
        .counter = std::stoll(fields.at("last_seq")),
    };
    return core::Result<ClockState, std::string>::ok(state);
  } catch (const std::exception& e) {
    return core::Result<ClockState, std::string>::err("Redis error: " + std::string(e.what()));
  }
}

CasResult RedisClockStateStore::compare_and_swap(const std::string& key,
                                                 const ClockState& expected,
                                                 const ClockState& desired) {
  try {
    std::vector<std::string> keys = {key};
    std::vector<std::string> args = {
        std::to_string(expected.tick), std::to_string(expected.counter),
        std::to_string(desired.tick), std::to_string(desired.counter)};

    sw::redis::StringView script_sha{cas_script_sha_};
    const long long reply = redis_->evalsha<long long>(script_sha, keys.begin(), keys.end(),
                                                       args.begin(), args.end());
    switch (reply) {
      case 1:
        return CasResult{CasOutcome::kSwapped, ""};
      case 0:
        return CasResult{CasOutcome::kConflict, ""};
      default:
        return CasResult{CasOutcome::kBackendError, "State key not found: " + key};
    }
  } catch (const std::exception& e) {
    return CasResult{CasOutcome::kBackendError, "Redis error: " + std::string(e.what())};
  }
}

}  // namespace wid::storage::redis
