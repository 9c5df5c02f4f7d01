#pragma once

#include "wid/core/time_unit.h"
#include "wid/id/grammar.h"
#include "wid/id/hlc_generator.h"
#include "wid/id/wid_generator.h"
#include "wid/storage/shared_allocator.h"

#include "shared/arg_parser.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace wid::cli {

// IdCliConfig collects the flags shared by every identifier subcommand.
struct IdCliConfig {
  storage::IdKind kind{storage::IdKind::kWid};         // NOLINT(readability-identifier-naming)
  std::string node;                                    // NOLINT(readability-identifier-naming)
  int w{id::kDefaultDigitWidth};                       // NOLINT(readability-identifier-naming)
  std::size_t z{id::kDefaultPaddingWidth};             // NOLINT(readability-identifier-naming)
  core::TimeUnit unit{core::TimeUnit::kSec};           // NOLINT(readability-identifier-naming)
  std::size_t count{0};                                // NOLINT(readability-identifier-naming)
  bool json{false};                                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;                // NOLINT(readability-identifier-naming)
};

// Which optional flags a subcommand accepts on top of --kind/--W/--Z/--time-unit.
struct IdFlagSet {
  bool node{false};   // NOLINT(readability-identifier-naming)
  bool count{false};  // NOLINT(readability-identifier-naming)
  bool json{false};   // NOLINT(readability-identifier-naming)
  bool store{false};  // NOLINT(readability-identifier-naming)
};

// $NODE, or "cpp" when unset or empty.
[[nodiscard]] std::string default_node();

[[nodiscard]] IdCliConfig default_id_config();

[[nodiscard]] std::vector<apps::Option<IdCliConfig>> id_options(const IdFlagSet& flags);

// Strict unsigned decimal parse; rejects signs, blanks and overflow.
[[nodiscard]] std::optional<std::size_t> parse_count(const std::string& text);

// Builds the generator selected by config.kind and hands it to fn.
// Construction errors are reported to stderr and yield exit code 1.
template <typename Fn>
int with_generator(const IdCliConfig& config, Fn&& fn) {
  if (config.kind == storage::IdKind::kHlc) {
    auto gen = id::HlcWidGen::create(config.node, config.w, config.z, config.unit);
    if (!gen.has_value()) {
      std::cerr << "Error: " << core::describe(gen.error()) << "\n";
      return 1;
    }
    return fn(gen.value());
  }
  auto gen = id::WidGen::create(config.w, config.z, config.unit);
  if (!gen.has_value()) {
    std::cerr << "Error: " << core::describe(gen.error()) << "\n";
    return 1;
  }
  return fn(gen.value());
}

}  // namespace wid::cli
