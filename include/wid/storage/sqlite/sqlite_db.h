#pragma once

#include "wid/core/result.h"

#include <cstdint>
#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace wid::storage::sqlite {

// SqliteDb owns one connection to a clock-state database.
// Several processes may open the same file; each waits up to busy_timeout_ms
// for a competing writer instead of failing with SQLITE_BUSY. File databases
// run in WAL mode so a load never blocks a concurrent compare-and-swap.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path, int busy_timeout_ms = 5000);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 until ensure_schema_v1() has run.
  [[nodiscard]] int get_schema_version() const;

  // Creates schema_version and wid_state. Safe to call from every process
  // that opens the file.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Rows modified by the most recent INSERT/UPDATE on this connection.
  [[nodiscard]] int changes() const;

  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Outcome of PreparedStatement::step().
enum class StepResult {
  kRow,   // a result row is available
  kDone,  // statement finished
  kBusy,  // another connection holds the write lock past the busy timeout
  kError,
};

// RAII wrapper for one prepared statement. Bind indexes are 1-based,
// column indexes 0-based, as in the C API.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  void bind_text(int index, const std::string& value);
  void bind_int64(int index, std::int64_t value);

  [[nodiscard]] StepResult step();

  [[nodiscard]] std::int64_t column_int64(int column) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace wid::storage::sqlite
