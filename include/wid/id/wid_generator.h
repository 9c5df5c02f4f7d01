#pragma once

#include "wid/core/clock.h"
#include "wid/core/padding.h"
#include "wid/core/result.h"
#include "wid/core/time_unit.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wid::id {

// WidState is the persisted clock of a plain generator.
// last_seq == -1 is the pre-generation sentinel.
struct WidState {
  std::int64_t last_tick{0};  // NOLINT(readability-identifier-naming)
  std::int64_t last_seq{-1};  // NOLINT(readability-identifier-naming)

  bool operator==(const WidState&) const = default;
};

// WidGen produces strictly increasing plain WIDs from a single-process clock.
//
// Invariants:
// - (last_tick, last_seq) is non-decreasing lexicographically across calls,
//   even when the clock stalls or steps backwards
// - the sequence never exceeds 10^W - 1; exhaustion bumps the tick by one unit
// - the padding block is not part of the ordering key
//
// Not thread-safe: one logical thread drives an instance at a time.
class WidGen {
 public:
  using CreateResult = core::Result<WidGen, core::WidError>;

  // Fails with kInvalidW unless 1 <= w <= 18. A null clock or padding source
  // selects the system implementation.
  [[nodiscard]] static CreateResult create(int w, std::size_t z,
                                           core::TimeUnit unit = core::TimeUnit::kSec,
                                           std::shared_ptr<core::ITickClock> clock = nullptr,
                                           std::shared_ptr<core::IPaddingSource> padding = nullptr);

  // W=4, Z=6, sec, system clock.
  [[nodiscard]] static WidGen create_default();

  ~WidGen() = default;

  // Exclusive ownership of the clock state: movable, not copyable.
  WidGen(const WidGen&) = delete;
  WidGen& operator=(const WidGen&) = delete;
  WidGen(WidGen&&) = default;
  WidGen& operator=(WidGen&&) = default;

  // Generate the next WID.
  std::string next();

  // Generate n WIDs in order.
  std::vector<std::string> next_n(std::size_t n);

  [[nodiscard]] WidState state() const { return WidState{last_tick_, last_seq_}; }

  using UpdateResult = core::Result<bool, core::WidError>;

  // Resume a previously persisted generator. Fails with kInvalidState, leaving
  // the state untouched, if last_tick is negative or past max_tick() or
  // last_seq is below -1. A last_seq above 10^W - 1 is clamped to it, so the
  // next id rolls into the following tick.
  [[nodiscard]] UpdateResult restore_state(std::int64_t last_tick, std::int64_t last_seq);

  [[nodiscard]] int digit_width() const { return w_; }
  [[nodiscard]] std::size_t padding_width() const { return z_; }
  [[nodiscard]] core::TimeUnit time_unit() const { return unit_; }

 private:
  WidGen(int w, std::size_t z, core::TimeUnit unit, std::shared_ptr<core::ITickClock> clock,
         std::shared_ptr<core::IPaddingSource> padding);

  // Formatting dominates the cost of next(); re-render only when the tick changes.
  const std::string& timestamp_for(std::int64_t tick);

  int w_;
  std::size_t z_;
  core::TimeUnit unit_;
  std::int64_t max_seq_;

  std::int64_t last_tick_{0};
  std::int64_t last_seq_{-1};

  std::optional<std::int64_t> cached_tick_;
  std::string cached_timestamp_;

  std::shared_ptr<core::ITickClock> clock_;
  std::shared_ptr<core::IPaddingSource> padding_;
};

}  // namespace wid::id
