#include "booking.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace booking::model {

BookingStatus ParseBookingStatus(std::string_view text) {
  for (auto status : {BookingStatus::kPending, BookingStatus::kScheduled, BookingStatus::kConfirmed, BookingStatus::kCompleted,
                      BookingStatus::kCancelled, BookingStatus::kNoShow}) {
    if (ToString(status) == text) return status;
  }
  throw util::InvalidArgument("unknown booking status: " + std::string(text));
}

std::vector<std::string> ConflictReport::BookingIds() const {
  std::vector<std::string> ids;
  ids.reserve(conflicts.size());
  for (const auto& entry : conflicts) {
    ids.push_back(entry.booking.id);
  }
  return ids;
}

ConflictReport FindOverlaps(const TimeInterval& interval, const std::vector<ExistingBooking>& bookings,
                            const std::optional<std::string>& resource_id, const std::optional<std::string>& exclude_booking_id) {
  ConflictReport report;
  for (const auto& booking : bookings) {
    if (!booking.BlocksTime()) continue;
    if (exclude_booking_id && booking.id == *exclude_booking_id) continue;
    if (resource_id && booking.resource_id != resource_id) continue;

    if (auto overlap = Intersection(interval, booking.interval)) {
      report.conflicts.push_back(ConflictEntry{booking, *overlap});
    }
  }

  std::sort(report.conflicts.begin(), report.conflicts.end(), [](const ConflictEntry& a, const ConflictEntry& b) {
    if (a.booking.interval.start != b.booking.interval.start) return a.booking.interval.start < b.booking.interval.start;
    return a.booking.id < b.booking.id;
  });
  return report;
}

} // namespace booking::model
