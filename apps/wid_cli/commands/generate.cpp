#include "generate.h"

#include "wid/id/id_stream.h"

#include <nlohmann/json.hpp>

#include "id_options.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>

using wid::cli::IdCliConfig;

namespace {

constexpr std::size_t kDefaultBenchCount = 100000;

bool validate_for(const IdCliConfig& config, const std::string& id) {
  if (config.kind == wid::storage::IdKind::kHlc) {
    return wid::id::validate_hlc_wid(id, config.w, config.z, config.unit);
  }
  return wid::id::validate_wid(id, config.w, config.z, config.unit);
}

}  // namespace

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.node = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }

  return wid::cli::with_generator(parsed.config, [](auto& gen) {
    std::cout << gen.next() << "\n";
    return 0;
  });
}

int cmd_stream(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.node = true, .count = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }

  const std::size_t count = parsed.config.count;
  return wid::cli::with_generator(parsed.config, [count](auto& gen) {
    // Stops early once stdout is closed (e.g. piped into head).
    wid::id::stream_ids(gen, count, [](const std::string& id) {
      std::cout << id << "\n" << std::flush;
      return static_cast<bool>(std::cout);
    });
    return 0;
  });
}

int cmd_healthcheck(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.node = true, .json = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }
  const IdCliConfig& config = parsed.config;

  return wid::cli::with_generator(config, [&config](auto& gen) {
    const std::string sample = gen.next();
    const bool ok = validate_for(config, sample);

    if (config.json) {
      nlohmann::json out;
      out["ok"] = ok;
      out["kind"] = wid::storage::to_string(config.kind);
      out["W"] = config.w;
      out["Z"] = config.z;
      out["time_unit"] = std::string(wid::core::to_string(config.unit));
      out["sample_id"] = sample;
      std::cout << out.dump() << "\n";
    } else {
      std::cout << "ok=" << (ok ? "true" : "false")
                << " kind=" << wid::storage::to_string(config.kind) << " sample=" << sample
                << "\n";
    }

    if (!ok) {
      std::cerr << "Error: healthcheck failed\n";
      return 1;
    }
    return 0;
  });
}

int cmd_bench(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.node = true, .count = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }
  IdCliConfig config = parsed.config;
  if (config.count == 0) {
    config.count = kDefaultBenchCount;
  }

  return wid::cli::with_generator(config, [&config](auto& gen) {
    const auto start = std::chrono::steady_clock::now();
    std::size_t total_len = 0;
    for (std::size_t i = 0; i < config.count; ++i) {
      total_len += gen.next().size();
    }
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    const double seconds = std::max(elapsed.count(), 1e-9);

    nlohmann::json out;
    out["impl"] = "cpp";
    out["kind"] = wid::storage::to_string(config.kind);
    out["W"] = config.w;
    out["Z"] = config.z;
    out["time_unit"] = std::string(wid::core::to_string(config.unit));
    out["n"] = config.count;
    out["seconds"] = seconds;
    out["ids_per_sec"] = static_cast<double>(config.count) / seconds;
    out["bytes"] = total_len;
    std::cout << out.dump() << "\n";
    return 0;
  });
}
