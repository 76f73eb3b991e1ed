#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/model/booking.hpp"
#include "internal/store/appointment_store.hpp"

namespace booking::scheduling {

/*
  ConflictDetector

  Read-only overlap query against committed bookings. The evaluation itself
  is model::FindOverlaps, the same function the store write path runs.
*/
class ConflictDetector {
 public:
  explicit ConflictDetector(std::shared_ptr<store::AppointmentStore> store);

  // Empty report when nothing overlaps.
  model::ConflictReport Detect(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                               const std::optional<std::string>& exclude_booking_id, std::optional<util::TimePoint> deadline) const;

 private:
  std::shared_ptr<store::AppointmentStore> store_;
};

} // namespace booking::scheduling
