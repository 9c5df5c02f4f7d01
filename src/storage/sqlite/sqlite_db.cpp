#include "wid/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <utility>

namespace wid::storage::sqlite {

namespace {

using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

// One row per state key. last_seq holds the HLC logical counter for hlc keys.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS wid_state (
  k TEXT PRIMARY KEY,
  last_tick INTEGER NOT NULL,
  last_seq INTEGER NOT NULL
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

core::Result<bool, std::string> run_script(sqlite3* db, const char* sql, const std::string& what) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err(what + ": " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

OpenResult SqliteDb::open(const std::string& path, const int busy_timeout_ms) {
  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("Failed to open database: " + error);
  }
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));

  if (sqlite3_busy_timeout(raw, busy_timeout_ms) != SQLITE_OK) {
    return OpenResult::err("Failed to set busy timeout: " + db->last_error());
  }

  if (path != ":memory:") {
    auto wal = run_script(raw, "PRAGMA journal_mode=WAL;", "Failed to enable WAL");
    if (!wal.has_value()) {
      return OpenResult::err(wal.error());
    }
  }

  return OpenResult::ok(std::move(db));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }
  if (stmt.step() != StepResult::kRow) {
    return 0;
  }
  return static_cast<int>(stmt.column_int64(0));
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }
  return run_script(db_.get(), kSchemaV1, "Failed to apply schema v1");
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  return run_script(db_.get(), sql.c_str(), "SQL execution failed");
}

int SqliteDb::changes() const { return sqlite3_changes(db_.get()); }

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_.get()); }

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
    return;
  }
  stmt_.reset(raw_stmt);
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int64(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, value);
}

StepResult PreparedStatement::step() {
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return StepResult::kRow;
    case SQLITE_DONE:
      return StepResult::kDone;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return StepResult::kBusy;
    default:
      return StepResult::kError;
  }
}

std::int64_t PreparedStatement::column_int64(const int column) const {
  return sqlite3_column_int64(stmt_.get(), column);
}

}  // namespace wid::storage::sqlite
