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

// HlcState is the hybrid logical clock: physical-time ticks plus a logical counter.
struct HlcState {
  std::int64_t pt{0};  // NOLINT(readability-identifier-naming)
  std::int64_t lc{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const HlcState&) const = default;
};

// HlcWidGen produces node-aware identifiers ordered by a Hybrid Logical Clock
// (Kulkarni et al.). Each instance issues strictly increasing (pt, lc) pairs;
// observe() merges a remote (pt, lc) so the local clock is causally ahead of
// both its prior state and the remote one.
//
// Rollover: when lc would exceed 10^W - 1, pt advances one tick and lc resets.
//
// Not thread-safe: one logical thread drives an instance at a time. Remote
// observations travel out-of-band over a channel the caller provides.
class HlcWidGen {
 public:
  using CreateResult = core::Result<HlcWidGen, core::WidError>;
  using UpdateResult = core::Result<bool, core::WidError>;

  // Fails with kInvalidW unless 1 <= w <= 18, then kInvalidNode unless node
  // matches [A-Za-z0-9_]+.
  [[nodiscard]] static CreateResult create(std::string node, int w, std::size_t z,
                                           core::TimeUnit unit = core::TimeUnit::kSec,
                                           std::shared_ptr<core::ITickClock> clock = nullptr,
                                           std::shared_ptr<core::IPaddingSource> padding = nullptr);

  ~HlcWidGen() = default;

  HlcWidGen(const HlcWidGen&) = delete;
  HlcWidGen& operator=(const HlcWidGen&) = delete;
  HlcWidGen(HlcWidGen&&) = default;
  HlcWidGen& operator=(HlcWidGen&&) = default;

  // Advance the clock and render the next HLC-WID.
  std::string next();

  std::vector<std::string> next_n(std::size_t n);

  // Merge a remote clock observation. Fails with kInvalidRemoteClock, leaving
  // the state untouched, if either value is negative or remote_pt is past
  // max_tick(). A counter at or above 10^W - 1 rolls over into the next tick.
  [[nodiscard]] UpdateResult observe(std::int64_t remote_pt, std::int64_t remote_lc);

  [[nodiscard]] HlcState state() const { return HlcState{pt_, lc_}; }

  // Same range checks as observe().
  [[nodiscard]] UpdateResult restore_state(std::int64_t pt, std::int64_t lc);

  [[nodiscard]] const std::string& node() const { return node_; }
  [[nodiscard]] int digit_width() const { return w_; }
  [[nodiscard]] std::size_t padding_width() const { return z_; }
  [[nodiscard]] core::TimeUnit time_unit() const { return unit_; }

 private:
  HlcWidGen(std::string node, int w, std::size_t z, core::TimeUnit unit,
            std::shared_ptr<core::ITickClock> clock, std::shared_ptr<core::IPaddingSource> padding);

  // Moves to the first (pt, lc) strictly after (pt, lc), rolling into pt + 1
  // when lc has no room left.
  void advance_past(std::int64_t pt, std::int64_t lc);
  const std::string& timestamp_for(std::int64_t tick);

  std::string node_;
  int w_;
  std::size_t z_;
  core::TimeUnit unit_;
  std::int64_t max_lc_;

  std::int64_t pt_{0};
  std::int64_t lc_{0};

  std::optional<std::int64_t> cached_tick_;
  std::string cached_timestamp_;

  std::shared_ptr<core::ITickClock> clock_;
  std::shared_ptr<core::IPaddingSource> padding_;
};

}  // namespace wid::id
