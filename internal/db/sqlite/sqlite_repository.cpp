#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace booking::db::sqlite {

using booking::db::ErrorCode;
using booking::db::Result;

namespace {

constexpr const char* kBookingColumns = "id,resource_id,start_ms,end_ms,status,payload,created_at_ms,updated_at_ms";

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
    if (rc != SQLITE_OK) {
      throw db::DbError(TranslateCode(rc), std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // Throws DbError on anything but SQLITE_ROW / SQLITE_DONE.
  bool StepRow() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw db::DbError(TranslateCode(rc), std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id            = ColText(st, 0);
  r.resource_id   = ColOptionalText(st, 1);
  r.start_ms      = ColI64(st, 2);
  r.end_ms        = ColI64(st, 3);
  r.status        = ColText(st, 4);
  r.payload       = ColText(st, 5);
  r.created_at_ms = ColI64(st, 6);
  r.updated_at_ms = ColI64(st, 7);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS resource ("
      "id TEXT PRIMARY KEY, display_name TEXT NOT NULL DEFAULT '');");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS booking ("
      "id TEXT PRIMARY KEY, resource_id TEXT, start_ms INTEGER NOT NULL, end_ms INTEGER NOT NULL, "
      "status TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "CHECK (start_ms < end_ms));");
  db.Exec("CREATE INDEX IF NOT EXISTS booking_resource_start ON booking(resource_id, start_ms);");
  db.Exec("CREATE INDEX IF NOT EXISTS booking_start ON booking(start_ms);");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(const TxOptions& options) {
    return std::make_unique<SqliteTransaction>(db_, options.deadline);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    const auto code = TranslateCode(rc);
    if (code == ErrorCode::OK) return Result::Ok();
    return Result::Err(code, sqlite3_errmsg(db));
}

// BEGIN IMMEDIATE already holds the database write lock.
Result SqliteRepository::LockResource(Transaction&, const std::optional<std::string>&) {
    return Result::Ok();
}

// ------------------------------------------------------------------
// Booking
// ------------------------------------------------------------------

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO booking(") + kBookingColumns + ") VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindOptionalText(st, 2, r.resource_id);
    BindI64(st, 3, r.start_ms);
    BindI64(st, 4, r.end_ms);
    BindText(st, 5, r.status);
    BindText(st, 6, r.payload);
    BindI64(st, 7, r.created_at_ms);
    BindI64(st, 8, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id + " already exists");
    return Translate(db, rc);
}

std::optional<model::BookingRecord>
SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), std::string("SELECT ") + kBookingColumns + " FROM booking WHERE id=?;");
    BindText(st.get(), 1, id);

    if (!st.StepRow()) return std::nullopt;
    return ReadBooking(st.get());
}

// The write lock from BEGIN IMMEDIATE already covers the row.
std::optional<model::BookingRecord>
SqliteRepository::LockBooking(Transaction& t, const std::string& id) {
    return GetBooking(t, id);
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE booking SET resource_id=?,start_ms=?,end_ms=?,status=?,payload=?,updated_at_ms=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptionalText(st, 1, r.resource_id);
    BindI64(st, 2, r.start_ms);
    BindI64(st, 3, r.end_ms);
    BindText(st, 4, r.status);
    BindText(st, 5, r.payload);
    BindI64(st, 6, r.updated_at_ms);
    BindText(st, 7, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "booking " + r.id + " not found");
    return Translate(db, rc);
}

std::vector<model::BookingRecord>
SqliteRepository::ListBookings(Transaction& t, const BookingQuery& query) {
    std::vector<model::BookingRecord> out;
    if (query.resource_ids && query.resource_ids->empty()) return out;

    std::string sql = std::string("SELECT ") + kBookingColumns + " FROM booking WHERE start_ms < ? AND end_ms > ?";
    if (!query.include_cancelled) sql += " AND status <> 'cancelled'";
    if (query.resource_ids) {
        sql += " AND resource_id IN (";
        for (std::size_t i = 0; i < query.resource_ids->size(); ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ")";
    }
    sql += " ORDER BY start_ms, id;";

    Statement st(TX(t).Handle(), sql);
    BindI64(st.get(), 1, query.end_ms);
    BindI64(st.get(), 2, query.start_ms);
    if (query.resource_ids) {
        int idx = 3;
        for (const auto& id : *query.resource_ids) {
            BindText(st.get(), idx++, id);
        }
    }

    while (st.StepRow()) {
        out.push_back(ReadBooking(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Resource
// ------------------------------------------------------------------

Result SqliteRepository::UpsertResource(Transaction& t, const model::ResourceRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO resource(id,display_name) VALUES(?,?) "
        "ON CONFLICT(id) DO UPDATE SET display_name=excluded.display_name;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.display_name);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::ResourceRecord> SqliteRepository::ListResources(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT id,display_name FROM resource ORDER BY id;");

    std::vector<model::ResourceRecord> out;
    while (st.StepRow()) {
        model::ResourceRecord r;
        r.id           = ColText(st.get(), 0);
        r.display_name = ColText(st.get(), 1);
        out.push_back(std::move(r));
    }
    return out;
}

}
