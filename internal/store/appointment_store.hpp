#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/booking.hpp"
#include "internal/model/time_interval.hpp"
#include "internal/util/time.hpp"

namespace booking::store {

struct ResourceInfo {
  std::string id;
  std::string display_name;
};

/*
  AppointmentStore

  Durable booking state consumed by the scheduling engine.

  Reads never return cancelled bookings. Every write re-runs the overlap
  check against the latest committed state inside the same atomic
  transaction that performs the write, so two racing writers for one
  resource end in exactly one success and one util::Conflict.

  Errors:
    util::InvalidArgument   malformed interval, unknown resource
    util::NotFound          unknown booking id
    util::Conflict          overlap found at write time
    util::StoreUnavailable  backend failure or deadline exceeded
*/
class AppointmentStore {
 public:
  virtual ~AppointmentStore() = default;

  // Non-cancelled bookings overlapping range. resource_ids unset returns
  // every booking (assigned or not); set returns only bookings assigned to
  // one of the listed resources. Ordered by start, then id.
  virtual std::vector<model::ExistingBooking> ListBookings(const model::TimeInterval&                     range,
                                                           const std::optional<std::vector<std::string>>& resource_ids,
                                                           std::optional<util::TimePoint>                 deadline) = 0;

  // Every registered resource, ordered by id.
  virtual std::vector<ResourceInfo> ListResources(std::optional<util::TimePoint> deadline) = 0;

  virtual std::optional<model::ExistingBooking> GetBooking(const std::string& booking_id) = 0;

  // Returns the new booking id.
  virtual std::string CreateBooking(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                    const std::string& payload) = 0;

  // Same check as CreateBooking, ignoring the booking being moved.
  virtual void UpdateBookingTime(const std::string& booking_id, const model::TimeInterval& new_interval) = 0;

  // Idempotent; a cancelled booking stops blocking time immediately.
  virtual void CancelBooking(const std::string& booking_id) = 0;

  virtual void RegisterResource(const ResourceInfo& resource) = 0;
};

} // namespace booking::store
