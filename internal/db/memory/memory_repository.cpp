#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace booking::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(const TxOptions& options) {
  return std::make_unique<MemoryTransaction>(*this, options.deadline);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::timed_mutex& MemoryRepository::ResourceMutex(const std::string& resource_id) {
  std::scoped_lock lock(mutex_);
  auto& slot = resource_mutexes_[resource_id];
  if (!slot) slot = std::make_unique<std::timed_mutex>();
  return *slot;
}

Result MemoryRepository::LockResource(Transaction& t, const std::optional<std::string>& resource_id) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  return tx.Lock(resource_id);
}

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  if (tx.View().bookings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id + " already exists");
  tx.WriteBooking(r);
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  tx.Read(MemoryTransaction::BookingKey(id));

  const auto& s  = tx.View();
  auto        it = s.bookings.find(id);
  if (it == s.bookings.end()) return std::nullopt;
  return it->second;
}

// A concurrent writer of the same row fails this transaction at commit.
std::optional<model::BookingRecord> MemoryRepository::LockBooking(Transaction& t, const std::string& id) {
  return GetBooking(t, id);
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  if (!tx.View().bookings.contains(r.id)) return Result::Err(ErrorCode::NotFound, "booking " + r.id + " not found");
  tx.WriteBooking(r);
  return Result::Ok();
}

std::vector<model::BookingRecord> MemoryRepository::ListBookings(Transaction& t, const BookingQuery& query) {
  auto& tx = TX(t);
  tx.CheckDeadline();

  if (query.resource_ids) {
    for (const auto& id : *query.resource_ids) {
      tx.Read(MemoryTransaction::ResourceKey(id));
    }
  } else {
    tx.Read(MemoryTransaction::kAllBookingsKey);
  }

  std::vector<model::BookingRecord> out;
  for (const auto& [_, record] : tx.View().bookings) {
    if (record.start_ms >= query.end_ms || record.end_ms <= query.start_ms) continue;
    if (!query.include_cancelled && record.status == "cancelled") continue;
    if (query.resource_ids) {
      if (!record.resource_id) continue;
      const auto& ids = *query.resource_ids;
      if (std::find(ids.begin(), ids.end(), *record.resource_id) == ids.end()) continue;
    }
    out.push_back(record);
  }

  std::sort(out.begin(), out.end(), [](const model::BookingRecord& a, const model::BookingRecord& b) {
    return a.start_ms != b.start_ms ? a.start_ms < b.start_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  tx.WriteResource(r);
  return Result::Ok();
}

std::vector<model::ResourceRecord> MemoryRepository::ListResources(Transaction& t) {
  auto& tx = TX(t);
  tx.CheckDeadline();
  tx.Read(MemoryTransaction::kRosterKey);

  std::vector<model::ResourceRecord> out;
  out.reserve(tx.View().resources.size());
  for (const auto& [_, record] : tx.View().resources) {
    out.push_back(record);
  }
  return out;
}

} // namespace booking::db::memory
