#include "wid/id/timestamp.h"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace wid::id {

namespace {

struct CivilTime {
  int year;
  unsigned month;
  unsigned day;
  long hours;
  long minutes;
  long seconds;
  long millis;
};

CivilTime to_civil(const core::Timestamp ts) {
  using namespace std::chrono;
  const auto day_point = floor<days>(ts);
  const year_month_day ymd{day_point};
  const hh_mm_ss<milliseconds> hms{ts - day_point};
  return CivilTime{static_cast<int>(ymd.year()),
                   static_cast<unsigned>(ymd.month()),
                   static_cast<unsigned>(ymd.day()),
                   static_cast<long>(hms.hours().count()),
                   static_cast<long>(hms.minutes().count()),
                   static_cast<long>(hms.seconds().count()),
                   static_cast<long>(hms.subseconds().count())};
}

core::Timestamp tick_to_timestamp(const std::int64_t tick, const core::TimeUnit unit) {
  using namespace std::chrono;
  const milliseconds since_epoch =
      unit == core::TimeUnit::kMs ? milliseconds{tick} : duration_cast<milliseconds>(seconds{tick});
  return core::Timestamp{since_epoch};
}

// Digits are guaranteed by the grammar; from_chars still guards the conversion.
bool read_int(const std::string_view digits, int& out) {
  const auto* end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

}  // namespace

std::string format_tick(const std::int64_t tick, const core::TimeUnit unit) {
  const CivilTime c = to_civil(tick_to_timestamp(tick, unit));

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << c.year << std::setw(2) << c.month << std::setw(2)
      << c.day << 'T' << std::setw(2) << c.hours << std::setw(2) << c.minutes << std::setw(2)
      << c.seconds;
  if (unit == core::TimeUnit::kMs) {
    oss << std::setw(3) << c.millis;
  }
  return oss.str();
}

std::optional<core::Timestamp> decode_timestamp(const std::string_view date_digits,
                                                const std::string_view time_digits,
                                                const core::TimeUnit unit) {
  using namespace std::chrono;

  if (date_digits.size() != 8 || time_digits.size() != static_cast<std::size_t>(core::time_digits(unit))) {
    return std::nullopt;
  }

  int y = 0;
  int mo = 0;
  int d = 0;
  int h = 0;
  int mi = 0;
  int s = 0;
  int ms = 0;
  if (!read_int(date_digits.substr(0, 4), y) || !read_int(date_digits.substr(4, 2), mo) ||
      !read_int(date_digits.substr(6, 2), d) || !read_int(time_digits.substr(0, 2), h) ||
      !read_int(time_digits.substr(2, 2), mi) || !read_int(time_digits.substr(4, 2), s)) {
    return std::nullopt;
  }
  if (unit == core::TimeUnit::kMs && !read_int(time_digits.substr(6, 3), ms)) {
    return std::nullopt;
  }

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
    return std::nullopt;
  }

  const auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{ms};
  return core::Timestamp{tp.time_since_epoch()};
}

std::string format_rfc3339(const core::Timestamp ts, const core::TimeUnit unit) {
  const CivilTime c = to_civil(ts);

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << c.year << '-' << std::setw(2) << c.month << '-'
      << std::setw(2) << c.day << 'T' << std::setw(2) << c.hours << ':' << std::setw(2)
      << c.minutes << ':' << std::setw(2) << c.seconds;
  if (unit == core::TimeUnit::kMs) {
    oss << '.' << std::setw(3) << c.millis;
  }
  oss << "+00:00";
  return oss.str();
}

}  // namespace wid::id
