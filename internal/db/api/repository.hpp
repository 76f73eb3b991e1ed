#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/resource_record.hpp"
#include "internal/util/time.hpp"

namespace booking::db {

struct TxOptions {
  // Statements still running past this instant fail with ErrorCode::Timeout.
  std::optional<util::TimePoint> deadline;
};

struct BookingQuery {
  // Bookings overlapping [start_ms, end_ms).
  int64_t start_ms = 0;
  int64_t end_ms   = 0;

  // Unset: every booking, assigned or not. Set: only bookings assigned to one
  // of these resources.
  std::optional<std::vector<std::string>> resource_ids;

  bool include_cancelled = false;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - LockResource() serializes check-then-write sequences for one resource
    (nullopt = the unassigned pool, which excludes every resource writer)
    until the transaction ends
  - LockBooking() reads a booking row; a concurrent writer of that row
    either waits for this transaction or fails it with a retryable error
  - ListBookings() results are ordered by start_ms, then id

  The DB is the source of truth for committed bookings.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(const TxOptions& options) = 0;

  virtual Result LockResource(Transaction&, const std::optional<std::string>& resource_id) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  // Read-for-write: use before UpdateBooking on the same row.
  virtual std::optional<model::BookingRecord> LockBooking(Transaction&, const std::string& id) = 0;

  virtual Result UpdateBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual std::vector<model::BookingRecord> ListBookings(Transaction&, const BookingQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Resources
  // ---------------------------------------------------------------------

  virtual Result UpsertResource(Transaction&, const model::ResourceRecord&) = 0;

  virtual std::vector<model::ResourceRecord> ListResources(Transaction&) = 0;
};

} // namespace booking::db
