#include "pg_repository.hpp"

#include "internal/db/postgres/pg_error.hpp"

namespace booking::db::postgres {

namespace {

model::BookingRecord ReadBooking(const pqxx::row& row) {
  model::BookingRecord r;
  r.id            = row[0].c_str();
  r.resource_id   = row[1].is_null() ? std::nullopt : std::optional<std::string>(row[1].c_str());
  r.start_ms      = row[2].as<int64_t>();
  r.end_ms        = row[3].as<int64_t>();
  r.status        = row[4].c_str();
  r.payload       = row[5].c_str();
  r.created_at_ms = row[6].as<int64_t>();
  r.updated_at_ms = row[7].as<int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS resource (id TEXT PRIMARY KEY, display_name TEXT NOT NULL DEFAULT '');");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS booking (id TEXT PRIMARY KEY, resource_id TEXT, start_ms BIGINT NOT NULL, end_ms BIGINT NOT NULL, "
      "status TEXT NOT NULL, payload TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "CHECK (start_ms < end_ms));");
  tx.exec("CREATE INDEX IF NOT EXISTS booking_resource_start ON booking(resource_id, start_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS booking_start ON booking(start_ms);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin(const TxOptions& options) {
  return std::make_unique<PgTransaction>(pool_, options.deadline);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(Classify(e), e.what());
}

Result PgRepository::LockResource(Transaction& t, const std::optional<std::string>& resource_id) {
  try {
    auto& work = TX(t).Work();
    if (resource_id) {
      work.exec_prepared("lock_pool_shared");
      work.exec_prepared("lock_resource", *resource_id);
    } else {
      work.exec_prepared("lock_pool_exclusive");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_booking", r.id, r.resource_id, r.start_ms, r.end_ms, r.status, r.payload, r.created_at_ms,
                               r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BookingRecord> PgRepository::GetBooking(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_booking", id);
    if (res.empty()) return std::nullopt;
    return ReadBooking(res[0]);
  } catch (const std::exception& e) {
    throw db::DbError(Classify(e), e.what());
  }
}

std::optional<model::BookingRecord> PgRepository::LockBooking(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_booking", id);
    if (res.empty()) return std::nullopt;
    return ReadBooking(res[0]);
  } catch (const std::exception& e) {
    throw db::DbError(Classify(e), e.what());
  }
}

Result PgRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_booking", r.id, r.resource_id, r.start_ms, r.end_ms, r.status, r.payload, r.updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "booking " + r.id + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BookingRecord> PgRepository::ListBookings(Transaction& t, const BookingQuery& query) {
  std::vector<model::BookingRecord> out;
  if (query.resource_ids && query.resource_ids->empty()) return out;

  try {
    auto& work = TX(t).Work();

    std::string sql =
        "SELECT id, resource_id, start_ms, end_ms, status, payload, created_at_ms, updated_at_ms "
        "FROM booking WHERE start_ms < $1 AND end_ms > $2";
    if (!query.include_cancelled) sql += " AND status <> 'cancelled'";
    if (query.resource_ids) {
      sql += " AND resource_id IN (";
      for (std::size_t i = 0; i < query.resource_ids->size(); ++i) {
        if (i > 0) sql += ",";
        sql += work.quote((*query.resource_ids)[i]);
      }
      sql += ")";
    }
    sql += " ORDER BY start_ms, id";

    auto res = work.exec_params(sql, query.end_ms, query.start_ms);
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadBooking(row));
    }
    return out;
  } catch (const std::exception& e) {
    throw db::DbError(Classify(e), e.what());
  }
}

Result PgRepository::UpsertResource(Transaction& t, const model::ResourceRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_resource", r.id, r.display_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ResourceRecord> PgRepository::ListResources(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("list_resources");

    std::vector<model::ResourceRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::ResourceRecord r;
      r.id           = row[0].c_str();
      r.display_name = row[1].c_str();
      out.push_back(std::move(r));
    }
    return out;
  } catch (const std::exception& e) {
    throw db::DbError(Classify(e), e.what());
  }
}

}
