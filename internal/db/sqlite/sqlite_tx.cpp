#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace booking::db::sqlite {

namespace {
constexpr int kProgressOpcodes = 1000;
}

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::optional<util::TimePoint> deadline)
    : db_(std::move(db)), lock_(db_->LockForTransaction()), deadline_(deadline) {
  if (deadline_) {
    sqlite3_progress_handler(db_->Handle(), kProgressOpcodes, &SqliteTransaction::ProgressHandler, this);
  }
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (...) {
    sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      BOOKING_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  if (deadline_) {
    sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
  }
}

int SqliteTransaction::ProgressHandler(void* self) {
  const auto* tx = static_cast<const SqliteTransaction*>(self);
  return tx->deadline_ && util::Now() > *tx->deadline_ ? 1 : 0;
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (deadline_) {
    sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  Finish();
}

} // namespace booking::db::sqlite
