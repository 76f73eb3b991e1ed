#include "memory_tx.hpp"

namespace booking::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, std::optional<util::TimePoint> deadline)
    : repo_(repo), deadline_(deadline) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::CheckDeadline() const {
  if (deadline_ && util::Now() > *deadline_) {
    throw DbError(ErrorCode::Timeout, "memory transaction deadline exceeded");
  }
}

void MemoryTransaction::WriteBooking(const model::BookingRecord& record) {
  if (auto it = working_.bookings.find(record.id); it != working_.bookings.end()) {
    write_keys_.insert(ResourceKey(it->second.resource_id));
  }
  write_keys_.insert(BookingKey(record.id));
  write_keys_.insert(ResourceKey(record.resource_id));
  write_keys_.insert(kAllBookingsKey);

  working_.bookings[record.id] = record;
  booking_writes_[record.id]   = record;
}

void MemoryTransaction::WriteResource(const model::ResourceRecord& record) {
  write_keys_.insert(kRosterKey);
  working_.resources[record.id] = record;
  resource_writes_[record.id]   = record;
}

Result MemoryTransaction::Lock(const std::optional<std::string>& resource_id) {
  if (pool_shared_.owns_lock() || pool_exclusive_.owns_lock()) {
    return Result::Err(ErrorCode::InternalError, "transaction already holds a resource lock");
  }

  const auto timeout = [] { return Result::Err(ErrorCode::Timeout, "memory transaction deadline exceeded waiting for lock"); };

  if (resource_id) {
    auto& resource_mutex = repo_.ResourceMutex(*resource_id);
    if (deadline_) {
      pool_shared_ = std::shared_lock<std::shared_timed_mutex>(repo_.pool_mutex_, *deadline_);
      if (!pool_shared_.owns_lock()) return timeout();
      resource_lock_ = std::unique_lock<std::timed_mutex>(resource_mutex, *deadline_);
      if (!resource_lock_.owns_lock()) {
        Release();
        return timeout();
      }
    } else {
      pool_shared_   = std::shared_lock<std::shared_timed_mutex>(repo_.pool_mutex_);
      resource_lock_ = std::unique_lock<std::timed_mutex>(resource_mutex);
    }
  } else if (deadline_) {
    pool_exclusive_ = std::unique_lock<std::shared_timed_mutex>(repo_.pool_mutex_, *deadline_);
    if (!pool_exclusive_.owns_lock()) return timeout();
  } else {
    pool_exclusive_ = std::unique_lock<std::shared_timed_mutex>(repo_.pool_mutex_);
  }

  // Move the snapshot up to the latest commit so the check that follows
  // sees every writer that held this lock before us.
  std::scoped_lock lock(repo_.mutex_);
  if (!ReadSetUnchanged()) {
    return Result::Err(ErrorCode::SerializationFailure, "transaction conflict: data read before the lock was modified");
  }
  if (write_keys_.empty()) {
    working_          = repo_.committed_;
    snapshot_version_ = repo_.committed_version_;
  }
  return Result::Ok();
}

bool MemoryTransaction::ReadSetUnchanged() const {
  for (const auto& key : read_keys_) {
    auto it = repo_.key_versions_.find(key);
    if (it != repo_.key_versions_.end() && it->second > snapshot_version_) {
      return false;
    }
  }
  return true;
}

void MemoryTransaction::Commit() {
  if (write_keys_.empty()) {
    committed_ = true;
    Release();
    return;
  }

  {
    std::scoped_lock lock(repo_.mutex_);
    if (!ReadSetUnchanged()) {
      throw DbError(ErrorCode::SerializationFailure, "transaction conflict: state was modified by a concurrent transaction");
    }

    for (auto& [id, record] : booking_writes_) {
      repo_.committed_.bookings[id] = std::move(record);
    }
    for (auto& [id, record] : resource_writes_) {
      repo_.committed_.resources[id] = std::move(record);
    }
    repo_.committed_version_++;
    for (const auto& key : write_keys_) {
      repo_.key_versions_[key] = repo_.committed_version_;
    }
  }

  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  Release();
}

void MemoryTransaction::Release() {
  if (resource_lock_.owns_lock()) resource_lock_.unlock();
  if (pool_shared_.owns_lock()) pool_shared_.unlock();
  if (pool_exclusive_.owns_lock()) pool_exclusive_.unlock();
}

} // namespace booking::db::memory
