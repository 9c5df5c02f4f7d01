#pragma once

#include "wid/core/time_unit.h"

#include <cstdint>

namespace wid::core {

// Abstract tick source for timestamp injection.
// Allows production code to read the wall clock while tests pin, advance or rewind time.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ITickClock {
 public:
  virtual ~ITickClock() = default;

  // Return elapsed whole seconds or whole milliseconds since the Unix epoch.
  // Contract: the only side effect of a call is reading a time source.
  virtual std::int64_t now_ticks(TimeUnit unit) = 0;

 protected:
  ITickClock() = default;
  ITickClock(const ITickClock&) = default;
  ITickClock& operator=(const ITickClock&) = default;
  ITickClock(ITickClock&&) = default;
  ITickClock& operator=(ITickClock&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public ITickClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_ticks(TimeUnit unit) override;
};

// Fixed clock: returns a settable instant for deterministic tests.
// The instant is held in milliseconds; second ticks are derived by floor division.
class FixedClock final : public ITickClock {
 public:
  explicit FixedClock(std::int64_t unix_millis = 0) : unix_millis_(unix_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_ticks(TimeUnit unit) override;

  void set_millis(std::int64_t unix_millis) { unix_millis_ = unix_millis; }
  void set_seconds(std::int64_t unix_seconds) { unix_millis_ = unix_seconds * 1000; }
  // Negative deltas model an NTP step-back.
  void advance_millis(std::int64_t delta) { unix_millis_ += delta; }

 private:
  std::int64_t unix_millis_;
};

}  // namespace wid::core
