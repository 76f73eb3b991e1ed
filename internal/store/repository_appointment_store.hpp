#pragma once

#include <memory>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/store/appointment_store.hpp"

namespace booking::store {

struct StoreOptions {
  // Attempts for a write whose commit lost an optimistic race.
  unsigned write_retry_attempts = 3;
};

/*
  AppointmentStore over a transactional db::Repository.

  Write transaction:
    [LockBooking] -> LockResource -> ListBookings -> model::FindOverlaps -> write -> Commit

  Reschedule and cancel read the booking through LockBooking, so the two
  never interleave on one row.

  A retryable commit failure replays the whole transaction, so the
  replay's overlap check sees the winner's booking and ends in Conflict.
*/
class RepositoryAppointmentStore final : public AppointmentStore {
 public:
  explicit RepositoryAppointmentStore(std::shared_ptr<db::Repository> repository, StoreOptions options = {});

  std::vector<model::ExistingBooking> ListBookings(const model::TimeInterval& range, const std::optional<std::vector<std::string>>& resource_ids,
                                                   std::optional<util::TimePoint> deadline) override;

  std::vector<ResourceInfo> ListResources(std::optional<util::TimePoint> deadline) override;

  std::optional<model::ExistingBooking> GetBooking(const std::string& booking_id) override;

  std::string CreateBooking(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                            const std::string& payload) override;

  void UpdateBookingTime(const std::string& booking_id, const model::TimeInterval& new_interval) override;

  void CancelBooking(const std::string& booking_id) override;

  void RegisterResource(const ResourceInfo& resource) override;

 private:
  template <typename Fn>
  auto RunWrite(std::string_view operation, Fn&& body);

  template <typename Fn>
  auto RunRead(std::string_view operation, std::optional<util::TimePoint> deadline, Fn&& body);

  // Throws util::Conflict when interval overlaps a committed booking.
  void CheckNoOverlap(db::Transaction& tx, std::string_view operation, const model::TimeInterval& interval,
                      const std::optional<std::string>& resource_id, const std::optional<std::string>& exclude_booking_id);

  void CheckResourceKnown(db::Transaction& tx, const std::string& resource_id);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;
};

} // namespace booking::store
