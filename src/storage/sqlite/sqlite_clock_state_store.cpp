#include "wid/storage/sqlite/sqlite_clock_state_store.h"

#include <utility>

namespace wid::storage::sqlite {

namespace {

using EnsureResult = core::Result<bool, std::string>;
using LoadResult = core::Result<ClockState, std::string>;

}  // namespace

SqliteClockStateStore::SqliteClockStateStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

EnsureResult SqliteClockStateStore::ensure(const std::string& key, const ClockState& initial) {
  PreparedStatement stmt(db_->connection(),
                         "INSERT OR IGNORE INTO wid_state (k, last_tick, last_seq) VALUES (?, ?, ?)");
  if (!stmt.is_valid()) {
    return EnsureResult::err("Failed to prepare statement: " + stmt.error());
  }
  stmt.bind_text(1, key);
  stmt.bind_int64(2, initial.tick);
  stmt.bind_int64(3, initial.counter);

  if (stmt.step() != StepResult::kDone) {
    return EnsureResult::err("Failed to insert state: " + db_->last_error());
  }
  return EnsureResult::ok(true);
}

LoadResult SqliteClockStateStore::load(const std::string& key) {
  PreparedStatement stmt(db_->connection(),
                         "SELECT last_tick, last_seq FROM wid_state WHERE k = ?");
  if (!stmt.is_valid()) {
    return LoadResult::err("Failed to prepare statement: " + stmt.error());
  }
  stmt.bind_text(1, key);

  switch (stmt.step()) {
    case StepResult::kRow:
      return LoadResult::ok(ClockState{
          .tick = stmt.column_int64(0),
          .counter = stmt.column_int64(1),
      });
    case StepResult::kDone:
      return LoadResult::err("State key not found: " + key);
    case StepResult::kBusy:
    case StepResult::kError:
      break;
  }
  return LoadResult::err("Failed to read state: " + db_->last_error());
}

CasResult SqliteClockStateStore::compare_and_swap(const std::string& key,
                                                  const ClockState& expected,
                                                  const ClockState& desired) {
  PreparedStatement stmt(db_->connection(),
                         "UPDATE wid_state SET last_tick = ?, last_seq = ? "
                         "WHERE k = ? AND last_tick = ? AND last_seq = ?");
  if (!stmt.is_valid()) {
    return CasResult{CasOutcome::kBackendError, "Failed to prepare statement: " + stmt.error()};
  }
  stmt.bind_int64(1, desired.tick);
  stmt.bind_int64(2, desired.counter);
  stmt.bind_text(3, key);
  stmt.bind_int64(4, expected.tick);
  stmt.bind_int64(5, expected.counter);

  switch (stmt.step()) {
    case StepResult::kDone:
      break;
    case StepResult::kBusy:
      return CasResult{CasOutcome::kConflict, ""};
    case StepResult::kRow:
    case StepResult::kError:
      return CasResult{CasOutcome::kBackendError,
                       "Failed to update state: " + db_->last_error()};
  }

  // Zero rows means another writer moved the state since our load.
  if (db_->changes() != 1) {
    return CasResult{CasOutcome::kConflict, ""};
  }
  return CasResult{CasOutcome::kSwapped, ""};
}

}  // namespace wid::storage::sqlite
