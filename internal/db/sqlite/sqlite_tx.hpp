#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "internal/util/time.hpp"
#include "sqlite_db.hpp"

namespace booking::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the database write lock up front, so a check-then-write
      sequence can never interleave with another writer
    - avoids deadlock-y lock upgrades later

  A deadline is enforced with a progress handler; statements running past
  it fail with SQLITE_INTERRUPT.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::optional<util::TimePoint> deadline);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  static int ProgressHandler(void* self);
  void       Finish();

  std::shared_ptr<SqliteDB>      db_;
  std::unique_lock<std::mutex>   lock_;
  std::optional<util::TimePoint> deadline_;
  bool committed_ = false;
  bool finished_  = false;
};

}
