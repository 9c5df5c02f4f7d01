#include "wid/id/hlc_generator.h"

#include "wid/id/grammar.h"
#include "wid/id/timestamp.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace wid::id {

HlcWidGen::HlcWidGen(std::string node, const int w, const std::size_t z,
                     const core::TimeUnit unit, std::shared_ptr<core::ITickClock> clock,
                     std::shared_ptr<core::IPaddingSource> padding)
    : node_(std::move(node)),
      w_(w),
      z_(z),
      unit_(unit),
      max_lc_(max_counter(w)),
      clock_(std::move(clock)),
      padding_(std::move(padding)) {}

HlcWidGen::CreateResult HlcWidGen::create(std::string node, const int w, const std::size_t z,
                                          const core::TimeUnit unit,
                                          std::shared_ptr<core::ITickClock> clock,
                                          std::shared_ptr<core::IPaddingSource> padding) {
  if (!is_valid_digit_width(w)) {
    return CreateResult::err(core::WidError::kInvalidW);
  }
  if (!is_valid_node(node)) {
    return CreateResult::err(core::WidError::kInvalidNode);
  }
  if (!clock) {
    clock = std::make_shared<core::SystemClock>();
  }
  if (!padding) {
    padding = std::make_shared<core::SystemPaddingSource>();
  }
  return CreateResult::ok(
      HlcWidGen(std::move(node), w, z, unit, std::move(clock), std::move(padding)));
}

void HlcWidGen::advance_past(const std::int64_t pt, const std::int64_t lc) {
  // lc is compared before the increment so a counter at INT64_MAX cannot overflow.
  if (lc >= max_lc_) {
    pt_ = pt + 1;
    lc_ = 0;
  } else {
    pt_ = pt;
    lc_ = lc + 1;
  }
}

const std::string& HlcWidGen::timestamp_for(const std::int64_t tick) {
  if (!cached_tick_.has_value() || cached_tick_.value() != tick) {
    cached_tick_ = tick;
    cached_timestamp_ = format_tick(tick, unit_);
  }
  return cached_timestamp_;
}

std::string HlcWidGen::next() {
  const std::int64_t now = clock_->now_ticks(unit_);
  if (now > pt_) {
    pt_ = now;
    lc_ = 0;
  } else {
    // Physical time stalled or went backwards: the logical counter carries order.
    advance_past(pt_, lc_);
  }

  std::ostringstream oss;
  oss << timestamp_for(pt_) << '.' << std::setfill('0') << std::setw(w_) << lc_ << "Z-" << node_;
  if (z_ > 0) {
    oss << '-' << padding_->hex(z_);
  }
  return oss.str();
}

std::vector<std::string> HlcWidGen::next_n(const std::size_t n) {
  std::vector<std::string> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(next());
  }
  return out;
}

HlcWidGen::UpdateResult HlcWidGen::observe(const std::int64_t remote_pt,
                                           const std::int64_t remote_lc) {
  if (remote_pt < 0 || remote_lc < 0 || remote_pt > max_tick(unit_)) {
    return UpdateResult::err(core::WidError::kInvalidRemoteClock);
  }

  const std::int64_t now = clock_->now_ticks(unit_);
  const std::int64_t new_pt = std::max({now, pt_, remote_pt});

  // Precedence matters: a three-way tie is handled by the first branch.
  if (new_pt == pt_ && new_pt == remote_pt) {
    advance_past(new_pt, std::max(lc_, remote_lc));
  } else if (new_pt == pt_) {
    advance_past(new_pt, lc_);
  } else if (new_pt == remote_pt) {
    advance_past(new_pt, remote_lc);
  } else {
    pt_ = new_pt;
    lc_ = 0;
  }
  return UpdateResult::ok(true);
}

HlcWidGen::UpdateResult HlcWidGen::restore_state(const std::int64_t pt, const std::int64_t lc) {
  if (pt < 0 || lc < 0 || pt > max_tick(unit_)) {
    return UpdateResult::err(core::WidError::kInvalidRemoteClock);
  }
  pt_ = pt;
  lc_ = lc;
  return UpdateResult::ok(true);
}

}  // namespace wid::id
