#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace booking::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static void BootstrapSchema(PgPool& pool);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
