#include "conflict_detector.hpp"

#include "internal/util/errors.hpp"

namespace booking::scheduling {

ConflictDetector::ConflictDetector(std::shared_ptr<store::AppointmentStore> store) : store_(std::move(store)) {
}

model::ConflictReport ConflictDetector::Detect(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                               const std::optional<std::string>& exclude_booking_id, std::optional<util::TimePoint> deadline) const {
  if (!(interval.start < interval.end)) {
    throw util::InvalidArgument("interval must satisfy start < end: " + model::ToString(interval));
  }

  std::optional<std::vector<std::string>> resource_filter;
  if (resource_id) {
    resource_filter = std::vector<std::string>{*resource_id};
  }

  const auto bookings = store_->ListBookings(interval, resource_filter, deadline);
  return model::FindOverlaps(interval, bookings, resource_id, exclude_booking_id);
}

} // namespace booking::scheduling
