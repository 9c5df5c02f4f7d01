#include "inspect.h"

#include "wid/id/timestamp.h"

#include <nlohmann/json.hpp>

#include "id_options.h"
#include <iostream>
#include <string>

using wid::cli::IdCliConfig;

namespace {

nlohmann::json padding_json(const std::optional<std::string>& padding) {
  if (padding.has_value()) {
    return padding.value();
  }
  return nullptr;
}

int print_wid(const IdCliConfig& config, const std::string& text) {
  const auto parsed = wid::id::parse_wid(text, config.w, config.z, config.unit);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << wid::core::describe(parsed.error()) << "\n";
    return 1;
  }
  const auto& plain = parsed.value();
  const std::string ts = wid::id::format_rfc3339(plain.timestamp, config.unit);

  if (config.json) {
    nlohmann::json out;
    out["raw"] = plain.raw;
    out["timestamp"] = ts;
    out["sequence"] = plain.sequence;
    out["padding"] = padding_json(plain.padding);
    std::cout << out.dump() << "\n";
  } else {
    std::cout << "raw=" << plain.raw << "\n";
    std::cout << "timestamp=" << ts << "\n";
    std::cout << "sequence=" << plain.sequence << "\n";
    std::cout << "padding=" << plain.padding.value_or("") << "\n";
  }
  return 0;
}

int print_hlc_wid(const IdCliConfig& config, const std::string& text) {
  const auto parsed = wid::id::parse_hlc_wid(text, config.w, config.z, config.unit);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << wid::core::describe(parsed.error()) << "\n";
    return 1;
  }
  const auto& hlc = parsed.value();
  const std::string ts = wid::id::format_rfc3339(hlc.timestamp, config.unit);

  if (config.json) {
    nlohmann::json out;
    out["raw"] = hlc.raw;
    out["timestamp"] = ts;
    out["logical_counter"] = hlc.logical_counter;
    out["node"] = hlc.node;
    out["padding"] = padding_json(hlc.padding);
    std::cout << out.dump() << "\n";
  } else {
    std::cout << "raw=" << hlc.raw << "\n";
    std::cout << "timestamp=" << ts << "\n";
    std::cout << "logical_counter=" << hlc.logical_counter << "\n";
    std::cout << "node=" << hlc.node << "\n";
    std::cout << "padding=" << hlc.padding.value_or("") << "\n";
  }
  return 0;
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: wid_cli validate <id> [--kind wid|hlc] [--W n] [--Z n] "
                 "[--time-unit sec|ms]\n";
    return 1;
  }

  const IdCliConfig& config = parsed.config;
  const std::string& id = parsed.positionals.front();
  const bool ok = config.kind == wid::storage::IdKind::kHlc
                      ? wid::id::validate_hlc_wid(id, config.w, config.z, config.unit)
                      : wid::id::validate_wid(id, config.w, config.z, config.unit);

  std::cout << (ok ? "true" : "false") << "\n";
  return ok ? 0 : 1;
}

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.json = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: wid_cli parse <id> [--kind wid|hlc] [--W n] [--Z n] "
                 "[--time-unit sec|ms] [--json]\n";
    return 1;
  }

  if (parsed.config.kind == wid::storage::IdKind::kHlc) {
    return print_hlc_wid(parsed.config, parsed.positionals.front());
  }
  return print_wid(parsed.config, parsed.positionals.front());
}
