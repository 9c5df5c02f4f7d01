#include "id_options.h"

#include <charconv>
#include <cstdlib>

namespace wid::cli {

std::string default_node() {
  const char* env = std::getenv("NODE");  // NOLINT(concurrency-mt-unsafe)
  if (env != nullptr && env[0] != '\0') {
    return env;
  }
  return "cpp";
}

IdCliConfig default_id_config() {
  IdCliConfig config;
  config.node = default_node();
  return config;
}

std::optional<std::size_t> parse_count(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<apps::Option<IdCliConfig>> id_options(const IdFlagSet& flags) {
  std::vector<apps::Option<IdCliConfig>> options = {
      {"--kind", true, "Identifier kind: wid or hlc",
       [](IdCliConfig& c, const std::string& v) {
         const auto kind = storage::parse_id_kind(v);
         if (!kind.has_value()) {
           return false;
         }
         c.kind = kind.value();
         return true;
       }},
      {"--W", true, "Sequence / logical counter digits (1-18)",
       [](IdCliConfig& c, const std::string& v) {
         const auto n = parse_count(v);
         if (!n.has_value() || n.value() > static_cast<std::size_t>(id::kMaxDigitWidth)) {
           return false;
         }
         c.w = static_cast<int>(n.value());
         return true;
       }},
      {"--Z", true, "Random padding hex digits (0 disables padding)",
       [](IdCliConfig& c, const std::string& v) {
         const auto n = parse_count(v);
         if (!n.has_value()) {
           return false;
         }
         c.z = n.value();
         return true;
       }},
      {"--time-unit", true, "Tick unit: sec or ms",
       [](IdCliConfig& c, const std::string& v) {
         const auto unit = core::parse_time_unit(v);
         if (!unit.has_value()) {
           return false;
         }
         c.unit = unit.value();
         return true;
       }},
  };

  if (flags.node) {
    options.push_back({"--node", true, "HLC node name ([A-Za-z0-9_]+, default $NODE or cpp)",
                       [](IdCliConfig& c, const std::string& v) {
                         c.node = v;
                         return true;
                       }});
  }
  if (flags.count) {
    options.push_back({"--count", true, "Number of identifiers",
                       [](IdCliConfig& c, const std::string& v) {
                         const auto n = parse_count(v);
                         if (!n.has_value()) {
                           return false;
                         }
                         c.count = n.value();
                         return true;
                       }});
  }
  if (flags.json) {
    options.push_back({"--json", false, "Emit a JSON object",
                       [](IdCliConfig& c, const std::string& /*v*/) {
                         c.json = true;
                         return true;
                       }});
  }
  if (flags.store) {
    options.push_back({"--db", true, "SQLite state database path",
                       [](IdCliConfig& c, const std::string& v) {
                         c.db_path = v;
                         return true;
                       }});
    options.push_back({"--redis", true, "Redis URI (e.g. tcp://127.0.0.1:6379)",
                       [](IdCliConfig& c, const std::string& v) {
                         c.redis_uri = v;
                         return true;
                       }});
  }
  return options;
}

}  // namespace wid::cli
