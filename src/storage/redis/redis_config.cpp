#include "wid/storage/redis/redis_config.h"

#include <charconv>
#include <string_view>

namespace wid::storage::redis {

namespace {

// Parses a non-empty all-digit string. Signs and whitespace are rejected.
std::optional<int> parse_decimal(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view host_port_view;
  bool allows_db = false;

  if (view.starts_with("tcp://")) {
    host_port_view = view.substr(6);
  } else if (view.starts_with("redis://")) {
    host_port_view = view.substr(8);
    allows_db = true;
  } else {
    return std::nullopt;
  }

  int redis_db = 0;
  const auto slash_pos = host_port_view.find('/');
  if (slash_pos != std::string_view::npos) {
    if (!allows_db) {
      return std::nullopt;
    }
    const auto db = parse_decimal(host_port_view.substr(slash_pos + 1));
    if (!db.has_value()) {
      return std::nullopt;
    }
    redis_db = db.value();
    host_port_view = host_port_view.substr(0, slash_pos);
  }

  if (host_port_view.empty()) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = host_port_view.rfind(':');
  std::string host;
  int port = 6379;

  if (colon_pos == std::string_view::npos) {
    host = std::string{host_port_view};
  } else {
    host = std::string{host_port_view.substr(0, colon_pos)};
    const auto parsed = parse_decimal(host_port_view.substr(colon_pos + 1));
    if (!parsed.has_value() || parsed.value() < 1 || parsed.value() > 65535) {
      return std::nullopt;
    }
    port = parsed.value();
  }

  if (host.empty()) {
    return std::nullopt;
  }

  return RedisConfig{uri, host, port, redis_db};
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.redis_db != 0) {
    out += "/" + std::to_string(config.redis_db);
  }
  return out;
}

}  // namespace wid::storage::redis
