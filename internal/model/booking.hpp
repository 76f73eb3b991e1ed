#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/time_interval.hpp"

namespace booking::model {

enum class BookingStatus : std::uint8_t {
  kPending   = 0,
  kScheduled = 1,
  kConfirmed = 2,
  kCompleted = 3,
  kCancelled = 4,
  kNoShow    = 5,
};

constexpr std::string_view ToString(BookingStatus status) {
  switch (status) {
    case BookingStatus::kPending:
      return "pending";
    case BookingStatus::kScheduled:
      return "scheduled";
    case BookingStatus::kConfirmed:
      return "confirmed";
    case BookingStatus::kCompleted:
      return "completed";
    case BookingStatus::kCancelled:
      return "cancelled";
    case BookingStatus::kNoShow:
      return "no_show";
  }
  return "unknown";
}

// Throws InvalidArgument on an unknown status string.
BookingStatus ParseBookingStatus(std::string_view text);

// Read projection of a stored appointment.
struct ExistingBooking {
  std::string                id;
  TimeInterval               interval;
  std::optional<std::string> resource_id;
  BookingStatus              status = BookingStatus::kScheduled;

  bool BlocksTime() const {
    return status != BookingStatus::kCancelled;
  }
};

struct ConflictEntry {
  ExistingBooking booking;
  TimeInterval    overlap;
};

struct ConflictReport {
  std::vector<ConflictEntry> conflicts;

  bool empty() const {
    return conflicts.empty();
  }

  std::vector<std::string> BookingIds() const;
};

/*
  Pure overlap evaluation shared by the read path (ConflictDetector) and the
  write path (store re-check inside the booking transaction).

  - cancelled bookings never conflict
  - resource_id set: only bookings assigned to that resource are considered
  - resource_id unset: every booking is considered
  - exclude_booking_id skips the booking being moved

  Entries are ordered by booking start, then id.
*/
ConflictReport FindOverlaps(const TimeInterval& interval, const std::vector<ExistingBooking>& bookings,
                            const std::optional<std::string>& resource_id, const std::optional<std::string>& exclude_booking_id);

} // namespace booking::model
