#include "wid/id/wid_generator.h"

#include "wid/id/grammar.h"
#include "wid/id/timestamp.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace wid::id {

namespace {

std::string zero_pad(const std::int64_t value, const int width) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(width) << value;
  return oss.str();
}

}  // namespace

WidGen::WidGen(const int w, const std::size_t z, const core::TimeUnit unit,
               std::shared_ptr<core::ITickClock> clock,
               std::shared_ptr<core::IPaddingSource> padding)
    : w_(w),
      z_(z),
      unit_(unit),
      max_seq_(max_counter(w)),
      clock_(std::move(clock)),
      padding_(std::move(padding)) {}

WidGen::CreateResult WidGen::create(const int w, const std::size_t z, const core::TimeUnit unit,
                                    std::shared_ptr<core::ITickClock> clock,
                                    std::shared_ptr<core::IPaddingSource> padding) {
  if (!is_valid_digit_width(w)) {
    return CreateResult::err(core::WidError::kInvalidW);
  }
  if (!clock) {
    clock = std::make_shared<core::SystemClock>();
  }
  if (!padding) {
    padding = std::make_shared<core::SystemPaddingSource>();
  }
  return CreateResult::ok(WidGen(w, z, unit, std::move(clock), std::move(padding)));
}

WidGen WidGen::create_default() {
  return WidGen(kDefaultDigitWidth, kDefaultPaddingWidth, core::TimeUnit::kSec,
                std::make_shared<core::SystemClock>(),
                std::make_shared<core::SystemPaddingSource>());
}

const std::string& WidGen::timestamp_for(const std::int64_t tick) {
  if (!cached_tick_.has_value() || cached_tick_.value() != tick) {
    cached_tick_ = tick;
    cached_timestamp_ = format_tick(tick, unit_);
  }
  return cached_timestamp_;
}

std::string WidGen::next() {
  const std::int64_t now = clock_->now_ticks(unit_);
  // A clock that steps backwards never drags the tick below what was issued.
  std::int64_t tick = std::max(now, last_tick_);
  std::int64_t seq = (tick == last_tick_) ? last_seq_ + 1 : 0;

  if (seq > max_seq_) {
    tick += 1;
    seq = 0;
  }

  last_tick_ = tick;
  last_seq_ = seq;

  std::string wid = timestamp_for(tick);
  wid += '.';
  wid += zero_pad(seq, w_);
  wid += 'Z';

  if (z_ > 0) {
    wid += '-';
    wid += padding_->hex(z_);
  }

  return wid;
}

std::vector<std::string> WidGen::next_n(const std::size_t n) {
  std::vector<std::string> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(next());
  }
  return out;
}

WidGen::UpdateResult WidGen::restore_state(const std::int64_t last_tick,
                                           const std::int64_t last_seq) {
  if (last_tick < 0 || last_tick > max_tick(unit_) || last_seq < -1) {
    return UpdateResult::err(core::WidError::kInvalidState);
  }
  last_tick_ = last_tick;
  last_seq_ = std::min(last_seq, max_seq_);
  return UpdateResult::ok(true);
}

}  // namespace wid::id
