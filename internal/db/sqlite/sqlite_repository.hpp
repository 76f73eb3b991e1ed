#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace booking::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(const TxOptions& options) override;

  Result LockResource(Transaction&, const std::optional<std::string>& resource_id) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  std::optional<model::BookingRecord> LockBooking(Transaction&, const std::string&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&) override;
  std::vector<model::BookingRecord> ListBookings(Transaction&, const BookingQuery& query) override;

  Result UpsertResource(Transaction&, const model::ResourceRecord&) override;
  std::vector<model::ResourceRecord> ListResources(Transaction&) override;

  // Creates the booking and resource tables when missing.
  static void BootstrapSchema(SqliteDB& db);

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
