#pragma once

#include "wid/core/result.h"
#include "wid/core/time.h"
#include "wid/core/time_unit.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wid::id {

// Identifier grammar, for fixed (W, Z, unit):
//
//   WID     ::= YYYYMMDD "T" HHMMSS[mmm] "." SEQ{W} "Z" [ "-" PAD{Z} ]
//   HLC-WID ::= YYYYMMDD "T" HHMMSS[mmm] "." LC{W}  "Z" "-" NODE [ "-" PAD{Z} ]
//
// NODE is [A-Za-z0-9_]+ and PAD is lowercase hex. The optional PAD block only
// exists in the grammar when Z > 0. Parameters are not self-describing in the
// string; callers supply the same (W, Z, unit) used at generation time.

constexpr int kDefaultDigitWidth = 4;         // W
constexpr std::size_t kDefaultPaddingWidth = 6;  // Z
// 10^18 - 1 is the widest counter that still fits std::int64_t.
constexpr int kMaxDigitWidth = 18;

// W is valid iff 1 <= W <= kMaxDigitWidth.
[[nodiscard]] constexpr bool is_valid_digit_width(const int w) noexcept {
  return w > 0 && w <= kMaxDigitWidth;
}

// Largest sequence / logical counter representable in W digits: 10^W - 1.
[[nodiscard]] constexpr std::int64_t max_counter(const int w) noexcept {
  std::int64_t p = 1;
  for (int i = 0; i < w; ++i) {
    p *= 10;
  }
  return p - 1;
}

// is_valid_node: non-empty and only ASCII letters, digits or underscore.
// Shared by HLC generator construction and HLC parsing.
[[nodiscard]] bool is_valid_node(std::string_view node);

// ParsedWid is a read-only view of a successfully parsed plain WID.
struct ParsedWid {
  std::string raw;                 // NOLINT(readability-identifier-naming)
  core::Timestamp timestamp;       // NOLINT(readability-identifier-naming)
  std::int64_t sequence{0};        // NOLINT(readability-identifier-naming)
  std::optional<std::string> padding;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::int64_t timestamp_sec() const { return core::to_unix_seconds(timestamp); }
  [[nodiscard]] std::int64_t timestamp_millis() const { return core::to_unix_millis(timestamp); }
};

// ParsedHlcWid is a read-only view of a successfully parsed HLC-WID.
struct ParsedHlcWid {
  std::string raw;                 // NOLINT(readability-identifier-naming)
  core::Timestamp timestamp;       // NOLINT(readability-identifier-naming)
  std::int64_t logical_counter{0};  // NOLINT(readability-identifier-naming)
  std::string node;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> padding;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::int64_t timestamp_sec() const { return core::to_unix_seconds(timestamp); }
  [[nodiscard]] std::int64_t timestamp_millis() const { return core::to_unix_millis(timestamp); }
};

using WidParseResult = core::Result<ParsedWid, core::WidError>;
using HlcWidParseResult = core::Result<ParsedHlcWid, core::WidError>;

// parse_wid decodes a plain WID.
// Errors, first match wins: kInvalidW, kInvalidFormat, kInvalidTimestamp.
[[nodiscard]] WidParseResult parse_wid(std::string_view wid, int w, std::size_t z,
                                       core::TimeUnit unit = core::TimeUnit::kSec);

// parse_hlc_wid decodes an HLC-WID.
// Errors, first match wins: kInvalidW, kInvalidFormat, kInvalidNode, kInvalidTimestamp.
[[nodiscard]] HlcWidParseResult parse_hlc_wid(std::string_view wid, int w, std::size_t z,
                                              core::TimeUnit unit = core::TimeUnit::kSec);

// validate_* collapse every parse error into false.
[[nodiscard]] bool validate_wid(std::string_view wid, int w, std::size_t z,
                                core::TimeUnit unit = core::TimeUnit::kSec);
[[nodiscard]] bool validate_hlc_wid(std::string_view wid, int w, std::size_t z,
                                    core::TimeUnit unit = core::TimeUnit::kSec);

}  // namespace wid::id
