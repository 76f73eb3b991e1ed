#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "internal/db/api/repository.hpp"

namespace booking::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Writers for one resource queue on that resource's lock; writers for the
  unassigned pool exclude every resource writer. Commit validates only the
  keys the transaction read, so writers on different resources never fail
  each other.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(const TxOptions& options) override;

  Result LockResource(Transaction&, const std::optional<std::string>& resource_id) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  std::optional<model::BookingRecord> LockBooking(Transaction&, const std::string&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&) override;
  std::vector<model::BookingRecord> ListBookings(Transaction&, const BookingQuery& query) override;

  Result UpsertResource(Transaction&, const model::ResourceRecord&) override;
  std::vector<model::ResourceRecord> ListResources(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::BookingRecord>  bookings;
    std::map<std::string, model::ResourceRecord> resources;
  };

  std::timed_mutex& ResourceMutex(const std::string& resource_id);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;

  // Version of the last commit that wrote each key.
  std::map<std::string, uint64_t> key_versions_;

  std::shared_timed_mutex                                  pool_mutex_;
  std::map<std::string, std::unique_ptr<std::timed_mutex>> resource_mutexes_;
};

}
