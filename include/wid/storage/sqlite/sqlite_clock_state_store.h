#pragma once

#include "wid/storage/clock_state_store.h"
#include "wid/storage/sqlite/sqlite_db.h"

#include <memory>
#include <string>

namespace wid::storage::sqlite {

// SqliteClockStateStore keeps one wid_state row per key. Several processes
// may open the same database file; CAS is a guarded UPDATE whose change count
// tells a swap from a conflict.
class SqliteClockStateStore final : public IClockStateStore {
 public:
  // The database must have schema v1 applied.
  explicit SqliteClockStateStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> ensure(const std::string& key,
                                                       const ClockState& initial) override;
  [[nodiscard]] core::Result<ClockState, std::string> load(const std::string& key) override;
  [[nodiscard]] CasResult compare_and_swap(const std::string& key, const ClockState& expected,
                                           const ClockState& desired) override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace wid::storage::sqlite
