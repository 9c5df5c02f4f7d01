#include "wid/id/grammar.h"

#include "wid/id/timestamp.h"

#include <charconv>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <shared_mutex>
#include <tuple>

namespace wid::id {

namespace {

enum class IdKind {
  kPlain,
  kHlc,
};

// Capture groups: 1=date, 2=time, 3=counter, then (HLC) 4=node, then padding.
std::string build_pattern(const IdKind kind, const int w, const std::size_t z,
                          const core::TimeUnit unit) {
  std::string pattern = "(\\d{8})T(\\d{" + std::to_string(core::time_digits(unit)) +
                        "})\\.(\\d{" + std::to_string(w) + "})Z";
  if (kind == IdKind::kHlc) {
    pattern += "-([A-Za-z0-9_]+)";
  }
  if (z > 0) {
    pattern += "(?:-([0-9a-f]{" + std::to_string(z) + "}))?";
  }
  return pattern;
}

using PatternKey = std::tuple<IdKind, int, std::size_t, core::TimeUnit>;

// Process-wide read-through cache. A compiled pattern is never mutated after
// insertion, so readers share it under a shared lock.
class PatternCache {
 public:
  std::shared_ptr<const std::regex> get(const IdKind kind, const int w, const std::size_t z,
                                        const core::TimeUnit unit) {
    const PatternKey key{kind, w, z, unit};
    {
      std::shared_lock lock(mutex_);
      auto it = patterns_.find(key);
      if (it != patterns_.end()) {
        return it->second;
      }
    }

    auto compiled = std::make_shared<const std::regex>(build_pattern(kind, w, z, unit));
    std::unique_lock lock(mutex_);
    // Another thread may have inserted the same key meanwhile; keep the first.
    auto [it, inserted] = patterns_.try_emplace(key, std::move(compiled));
    return it->second;
  }

 private:
  std::shared_mutex mutex_;
  std::map<PatternKey, std::shared_ptr<const std::regex>> patterns_;
};

PatternCache& pattern_cache() {
  static PatternCache cache;
  return cache;
}

// Default-parameter matchers are built once and bypass the cache lookup.
const std::regex& default_wid_pattern() {
  static const std::regex pattern(
      build_pattern(IdKind::kPlain, kDefaultDigitWidth, kDefaultPaddingWidth, core::TimeUnit::kSec));
  return pattern;
}

const std::regex& default_hlc_pattern() {
  static const std::regex pattern(build_pattern(IdKind::kHlc, kDefaultDigitWidth, 0, core::TimeUnit::kSec));
  return pattern;
}

// Eagerly build the defaults at load time.
[[maybe_unused]] const bool kDefaultsBuilt = (default_wid_pattern(), default_hlc_pattern(), true);

bool match(const std::regex& pattern, const std::string_view text, std::cmatch& caps) {
  return std::regex_match(text.data(), text.data() + text.size(), caps, pattern);
}

std::optional<std::int64_t> read_counter(const std::csub_match& group) {
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(group.first, group.second, value);
  if (ec != std::errc{} || ptr != group.second) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> optional_group(const std::cmatch& caps, const std::size_t index) {
  if (index < caps.size() && caps[index].matched) {
    return caps[index].str();
  }
  return std::nullopt;
}

}  // namespace

bool is_valid_node(const std::string_view node) {
  if (node.empty()) {
    return false;
  }
  for (const char ch : node) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

WidParseResult parse_wid(const std::string_view wid, const int w, const std::size_t z,
                         const core::TimeUnit unit) {
  if (!is_valid_digit_width(w)) {
    return WidParseResult::err(core::WidError::kInvalidW);
  }

  std::shared_ptr<const std::regex> owned;
  const std::regex* pattern = nullptr;
  if (w == kDefaultDigitWidth && z == kDefaultPaddingWidth && unit == core::TimeUnit::kSec) {
    pattern = &default_wid_pattern();
  } else {
    owned = pattern_cache().get(IdKind::kPlain, w, z, unit);
    pattern = owned.get();
  }

  std::cmatch caps;
  if (!match(*pattern, wid, caps)) {
    return WidParseResult::err(core::WidError::kInvalidFormat);
  }

  const auto sequence = read_counter(caps[3]);
  if (!sequence.has_value()) {
    return WidParseResult::err(core::WidError::kInvalidFormat);
  }

  const auto timestamp = decode_timestamp(std::string_view(caps[1].first, caps[1].length()),
                                          std::string_view(caps[2].first, caps[2].length()), unit);
  if (!timestamp.has_value()) {
    return WidParseResult::err(core::WidError::kInvalidTimestamp);
  }

  return WidParseResult::ok(ParsedWid{
      std::string(wid),
      timestamp.value(),
      sequence.value(),
      z > 0 ? optional_group(caps, 4) : std::nullopt,
  });
}

HlcWidParseResult parse_hlc_wid(const std::string_view wid, const int w, const std::size_t z,
                                const core::TimeUnit unit) {
  if (!is_valid_digit_width(w)) {
    return HlcWidParseResult::err(core::WidError::kInvalidW);
  }

  std::shared_ptr<const std::regex> owned;
  const std::regex* pattern = nullptr;
  if (w == kDefaultDigitWidth && z == 0 && unit == core::TimeUnit::kSec) {
    pattern = &default_hlc_pattern();
  } else {
    owned = pattern_cache().get(IdKind::kHlc, w, z, unit);
    pattern = owned.get();
  }

  std::cmatch caps;
  if (!match(*pattern, wid, caps)) {
    return HlcWidParseResult::err(core::WidError::kInvalidFormat);
  }

  const auto logical_counter = read_counter(caps[3]);
  if (!logical_counter.has_value()) {
    return HlcWidParseResult::err(core::WidError::kInvalidFormat);
  }

  std::string node = caps[4].str();
  if (!is_valid_node(node)) {
    return HlcWidParseResult::err(core::WidError::kInvalidNode);
  }

  const auto timestamp = decode_timestamp(std::string_view(caps[1].first, caps[1].length()),
                                          std::string_view(caps[2].first, caps[2].length()), unit);
  if (!timestamp.has_value()) {
    return HlcWidParseResult::err(core::WidError::kInvalidTimestamp);
  }

  return HlcWidParseResult::ok(ParsedHlcWid{
      std::string(wid),
      timestamp.value(),
      logical_counter.value(),
      std::move(node),
      z > 0 ? optional_group(caps, 5) : std::nullopt,
  });
}

bool validate_wid(const std::string_view wid, const int w, const std::size_t z,
                  const core::TimeUnit unit) {
  return parse_wid(wid, w, z, unit).has_value();
}

bool validate_hlc_wid(const std::string_view wid, const int w, const std::size_t z,
                      const core::TimeUnit unit) {
  return parse_hlc_wid(wid, w, z, unit).has_value();
}

}  // namespace wid::id
