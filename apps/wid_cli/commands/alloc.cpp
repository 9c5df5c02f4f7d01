#include "alloc.h"

#include "wid/storage/clock_state_store.h"
#include "wid/storage/redis/redis_config.h"
#include "wid/storage/shared_allocator.h"
#include "wid/storage/sqlite/sqlite_clock_state_store.h"
#include "wid/storage/sqlite/sqlite_db.h"

#ifdef WID_HAS_REDIS
#include "wid/storage/redis/redis_clock_state_store.h"
#endif

#include "id_options.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using wid::cli::IdCliConfig;

namespace {

// Opens the state store named on the command line, reporting failures to stderr.
std::unique_ptr<wid::storage::IClockStateStore> open_store(const IdCliConfig& config) {
  if (config.db_path.has_value()) {
    auto db_result = wid::storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Error: " << db_result.error() << "\n";
      return nullptr;
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Error: " << schema_result.error() << "\n";
      return nullptr;
    }
    std::cerr << "Using SQLite state store: " << config.db_path.value() << "\n";
    return std::make_unique<wid::storage::sqlite::SqliteClockStateStore>(db);
  }

  const auto parsed = wid::storage::redis::parse_redis_uri(config.redis_uri.value());
  if (!parsed.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << config.redis_uri.value() << "'\n"
              << "Accepted formats: tcp://host:port, redis://host:port[/db], tcp://host\n";
    return nullptr;
  }
#ifdef WID_HAS_REDIS
  try {
    auto store = std::make_unique<wid::storage::redis::RedisClockStateStore>(
        config.redis_uri.value());
    std::cerr << "Using Redis state store: "
              << wid::storage::redis::redis_config_to_log_string(parsed.value()) << "\n";
    return store;
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return nullptr;
  }
#else
  std::cerr << "Error: wid_cli was built without Redis support (WID_WITH_REDIS=OFF)\n";
  return nullptr;
#endif
}

}  // namespace

int cmd_alloc(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = wid::cli::id_options({.node = true, .count = true, .store = true});
  auto parsed = wid::apps::parse_options(argc, argv, options, 2, wid::cli::default_id_config());
  if (!parsed.ok) {
    return 1;
  }
  const IdCliConfig& config = parsed.config;

  if (config.db_path.has_value() == config.redis_uri.has_value()) {
    std::cerr << "Error: exactly one of --db <path> or --redis <uri> is required\n";
    return 1;
  }

  auto store = open_store(config);
  if (!store) {
    return 1;
  }

  const std::string key = wid::storage::state_key(config.kind, config.w, config.z, config.unit);
  const std::size_t count = config.count == 0 ? 1 : config.count;

  for (std::size_t i = 0; i < count; ++i) {
    const auto result =
        config.kind == wid::storage::IdKind::kHlc
            ? wid::storage::allocate_next_hlc_wid(*store, key, config.node, config.w, config.z,
                                                  config.unit)
            : wid::storage::allocate_next_wid(*store, key, config.w, config.z, config.unit);
    if (!result.has_value()) {
      std::cerr << "Error: " << result.error() << "\n";
      return 1;
    }
    std::cout << result.value() << "\n" << std::flush;
  }
  return 0;
}
