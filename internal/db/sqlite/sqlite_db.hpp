#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace booking::db::sqlite {

// Maps a sqlite3 result code onto the portable codes.
db::ErrorCode TranslateCode(int rc);

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of a repository;
  LockForTransaction() hands out exclusive use of it for the lifetime of
  one transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, bootstrap, transaction control).
  // Throws DbError.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize). Throws DbError.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::unique_lock<std::mutex> LockForTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace booking::db::sqlite
