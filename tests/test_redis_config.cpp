#include "wid/storage/redis/redis_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace wid::storage::redis;

// ── parse_redis_uri: accepted formats ──────────────────────────────────────

TEST_CASE("parse_redis_uri: tcp://host:port", "[redis][config]") {
  const auto result = parse_redis_uri("tcp://127.0.0.1:6379");
  REQUIRE(result.has_value());
  CHECK(result->host == "127.0.0.1");
  CHECK(result->port == 6379);
  CHECK(result->redis_db == 0);
  CHECK(result->uri == "tcp://127.0.0.1:6379");
}

TEST_CASE("parse_redis_uri: redis://host without port defaults to 6379", "[redis][config]") {
  const auto result = parse_redis_uri("redis://cache.internal");
  REQUIRE(result.has_value());
  CHECK(result->host == "cache.internal");
  CHECK(result->port == 6379);
}

TEST_CASE("parse_redis_uri: redis://host:port/N selects a database", "[redis][config]") {
  const auto result = parse_redis_uri("redis://localhost:6380/3");
  REQUIRE(result.has_value());
  CHECK(result->host == "localhost");
  CHECK(result->port == 6380);
  CHECK(result->redis_db == 3);
}

// ── parse_redis_uri: rejected formats ──────────────────────────────────────

TEST_CASE("parse_redis_uri: malformed input returns nullopt", "[redis][config]") {
  CHECK_FALSE(parse_redis_uri("").has_value());
  CHECK_FALSE(parse_redis_uri("localhost:6379").has_value());
  CHECK_FALSE(parse_redis_uri("http://localhost:6379").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://:6379").has_value());
}

TEST_CASE("parse_redis_uri: port must be a number in 1..65535", "[redis][config]") {
  CHECK_FALSE(parse_redis_uri("tcp://host:0").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:65536").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:-1").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:abc").has_value());
  CHECK_FALSE(parse_redis_uri("tcp://host:").has_value());
  CHECK(parse_redis_uri("tcp://host:65535").has_value());
}

TEST_CASE("parse_redis_uri: database suffix", "[redis][config]") {
  CHECK_FALSE(parse_redis_uri("tcp://localhost:6379/1").has_value());
  CHECK_FALSE(parse_redis_uri("redis://localhost:6379/").has_value());
  CHECK_FALSE(parse_redis_uri("redis://localhost:6379/x").has_value());
  CHECK_FALSE(parse_redis_uri("redis:///2").has_value());
}

// ── redis_config_to_log_string ──────────────────────────────────────────────

TEST_CASE("redis_config_to_log_string: host and port", "[redis][config]") {
  const RedisConfig config{"tcp://127.0.0.1:6379", "127.0.0.1", 6379, 0};
  CHECK(redis_config_to_log_string(config) == "127.0.0.1:6379");
}

TEST_CASE("redis_config_to_log_string: non-zero database is appended", "[redis][config]") {
  const auto parsed = parse_redis_uri("redis://myhost:1234/5");
  REQUIRE(parsed.has_value());
  CHECK(redis_config_to_log_string(parsed.value()) == "myhost:1234/5");
}
