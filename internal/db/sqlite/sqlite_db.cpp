#include "sqlite_db.hpp"

namespace booking::db::sqlite {

db::ErrorCode TranslateCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return db::ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return db::ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return db::ErrorCode::ConstraintViolation;
    case SQLITE_INTERRUPT:
      return db::ErrorCode::Timeout;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return db::ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return db::ErrorCode::Corruption;
    default:
      return db::ErrorCode::InternalError;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw db::DbError(TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw db::DbError(TranslateCode(rc), "sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw db::DbError(TranslateCode(rc), msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers on other connections proceed while a writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace booking::db::sqlite
