#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/time_interval.hpp"

namespace booking::model {

struct AvailabilitySearchRequest {
  util::TimePoint range_start{};
  util::TimePoint range_end{};

  // Unset means every known resource, never a resource literally named "any".
  std::optional<std::vector<std::string>> resource_ids;

  // Unset fields fall back to the scheduling policy defaults.
  std::optional<int> duration_minutes;
  std::optional<int> max_results;

  std::optional<std::string> location_id;

  // Buffer-aware generation: clearance around bookings and a wider step.
  std::optional<int> buffer_minutes;
  std::optional<int> step_minutes;
};

struct AvailableSlot {
  TimeInterval               interval;
  std::vector<std::string>   eligible_resource_ids; // ascending
  std::optional<std::string> location_id;

  bool operator==(const AvailableSlot&) const = default;
};

struct SuggestedSlot {
  AvailableSlot        slot;
  int                  rank = 0; // 1 = best
  std::chrono::minutes distance{0};
};

struct AlternativeOptions {
  std::optional<int> within_days;
  std::optional<int> max_suggestions;
  bool               include_buffer = false;
};

enum class ValidationReason : std::uint8_t {
  kDurationNotPositive,
  kDurationBelowMinimum,
  kDurationAboveMaximum,
  kClosedDay,
  kOutsideBusinessHours,
  kInPast,
  kInsufficientLeadTime,
  kBeyondBookingHorizon,
  kConflictsWithExistingBooking,
};

constexpr std::string_view ToString(ValidationReason reason) {
  switch (reason) {
    case ValidationReason::kDurationNotPositive:
      return "duration_not_positive";
    case ValidationReason::kDurationBelowMinimum:
      return "duration_below_minimum";
    case ValidationReason::kDurationAboveMaximum:
      return "duration_above_maximum";
    case ValidationReason::kClosedDay:
      return "closed_day";
    case ValidationReason::kOutsideBusinessHours:
      return "outside_business_hours";
    case ValidationReason::kInPast:
      return "in_past";
    case ValidationReason::kInsufficientLeadTime:
      return "insufficient_lead_time";
    case ValidationReason::kBeyondBookingHorizon:
      return "beyond_booking_horizon";
    case ValidationReason::kConflictsWithExistingBooking:
      return "conflicts_with_existing_booking";
  }
  return "unknown";
}

struct ValidationResult {
  bool                          valid = true;
  std::vector<ValidationReason> reasons;

  void Add(ValidationReason reason) {
    valid = false;
    reasons.push_back(reason);
  }

  bool Has(ValidationReason reason) const;

  std::vector<std::string> ReasonCodes() const;
};

} // namespace booking::model
