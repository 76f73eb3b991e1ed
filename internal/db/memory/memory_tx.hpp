#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace booking::db::memory {

/*
  Transaction = snapshot + read set + write set.

  Commit fails with SerializationFailure when another transaction committed
  a write to any key this one read after its snapshot was taken. Resource
  locks are held until Commit or Rollback.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, std::optional<util::TimePoint> deadline);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws DbError(Timeout) once the deadline has passed.
  void CheckDeadline() const;

  const MemoryRepository::State& View() const {
    return working_;
  }

  void Read(const std::string& key) {
    read_keys_.insert(key);
  }

  void WriteBooking(const model::BookingRecord& record);
  void WriteResource(const model::ResourceRecord& record);

  // Blocks until the lock is held or the deadline passes.
  Result Lock(const std::optional<std::string>& resource_id);

  static std::string BookingKey(const std::string& id) {
    return "booking:" + id;
  }
  static std::string ResourceKey(const std::optional<std::string>& resource_id) {
    return resource_id ? "resource:" + *resource_id : "unassigned";
  }
  static constexpr const char* kAllBookingsKey = "bookings";
  static constexpr const char* kRosterKey      = "roster";

 private:
  // Caller holds repo_.mutex_.
  bool ReadSetUnchanged() const;
  void Release();

  MemoryRepository&              repo_;
  MemoryRepository::State        working_;
  uint64_t                       snapshot_version_ = 0;
  std::optional<util::TimePoint> deadline_;
  bool                           committed_   = false;
  bool                           rolled_back_ = false;

  std::set<std::string>                        read_keys_;
  std::map<std::string, model::BookingRecord>  booking_writes_;
  std::map<std::string, model::ResourceRecord> resource_writes_;
  std::set<std::string>                        write_keys_;

  std::shared_lock<std::shared_timed_mutex> pool_shared_;
  std::unique_lock<std::shared_timed_mutex> pool_exclusive_;
  std::unique_lock<std::timed_mutex>        resource_lock_;
};

} // namespace booking::db::memory
