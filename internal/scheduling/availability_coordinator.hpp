#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/hours/business_hours_catalog.hpp"
#include "internal/model/availability.hpp"
#include "internal/model/booking.hpp"
#include "internal/scheduling/conflict_detector.hpp"
#include "internal/scheduling/schedule_builder.hpp"
#include "internal/scheduling/scheduling_policy.hpp"
#include "internal/store/appointment_store.hpp"
#include "internal/util/cancellation.hpp"

namespace booking::scheduling {

/*
  AvailabilityCoordinator

  Facade over the scheduling engine. Every operation is read-only: it
  never creates, moves or cancels a booking, and its answers are advisory
  snapshots that the booking write path re-checks atomically.

  Unassigned bookings belong to no resource schedule, so Search and the
  slot-producing operations never see them. IsSlotFree and DetectConflicts
  called without a resource_id check every booking, unassigned included.

  Errors:
    util::InvalidArgument   malformed request, raised before any store read
    util::StoreUnavailable  a store read failed or hit its deadline
    util::Cancelled         FindNextAvailable was cancelled between days
*/
class AvailabilityCoordinator {
 public:
  using NowFn = std::function<util::TimePoint()>;

  AvailabilityCoordinator(std::shared_ptr<hours::BusinessHoursCatalog> catalog, std::shared_ptr<store::AppointmentStore> store,
                          SchedulingPolicy policy = {}, NowFn now = util::Now);

  std::vector<model::AvailableSlot> Search(const model::AvailabilitySearchRequest& request, const util::CallOptions& options = {}) const;

  bool IsSlotFree(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                  const std::optional<std::string>& exclude_booking_id = std::nullopt, const util::CallOptions& options = {}) const;

  model::ConflictReport DetectConflicts(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                        const std::optional<std::string>& exclude_booking_id = std::nullopt,
                                        const util::CallOptions&          options            = {}) const;

  // Reports every violated rule at once instead of failing fast.
  model::ValidationResult ValidateSchedulingRules(util::TimePoint start, int duration_minutes, const std::optional<std::string>& resource_id,
                                                  const util::CallOptions& options = {}) const;

  // Slots in [preferred_start, preferred_start + within_days), closest first.
  std::vector<model::SuggestedSlot> SuggestAlternatives(util::TimePoint preferred_start, std::optional<int> duration_minutes,
                                                        const std::optional<std::string>& resource_id, const model::AlternativeOptions& alternatives = {},
                                                        const util::CallOptions& options = {}) const;

  // Earliest slot scanning one business-local day at a time; nullopt when
  // max_days_to_check days yield nothing.
  std::optional<model::SuggestedSlot> FindNextAvailable(util::TimePoint from, std::optional<int> duration_minutes,
                                                        const std::optional<std::vector<std::string>>& resource_ids,
                                                        std::optional<int> max_days_to_check = std::nullopt,
                                                        const util::CallOptions& options     = {}) const;

  // Per-resource slots for one business-local day.
  std::map<std::string, std::vector<model::AvailableSlot>> ResourceAvailability(util::LocalDays                                day,
                                                                                const std::optional<std::vector<std::string>>& resource_ids,
                                                                                std::optional<int>                             duration_minutes,
                                                                                const util::CallOptions& options = {}) const;

  const SchedulingPolicy& policy() const {
    return policy_;
  }

 private:
  struct SearchPlan {
    model::TimeInterval        range;
    util::Minutes              duration{0};
    util::Minutes              buffer{0};
    util::Minutes              step{0};
    std::size_t                max_results = 0;
    std::optional<std::string> location_id;
  };

  // Throws InvalidArgument; touches nothing.
  SearchPlan Plan(const model::AvailabilitySearchRequest& request) const;

  util::Minutes ResolveDuration(std::optional<int> duration_minutes) const;

  std::vector<std::string> ResolveResources(const std::optional<std::vector<std::string>>& requested, const util::CallOptions& options) const;

  std::vector<model::AvailableSlot> Run(const hours::HoursSnapshot& hours, const SearchPlan& plan, const std::vector<std::string>& resources,
                                        const util::CallOptions& options) const;

  std::optional<util::TimePoint> StoreDeadline(const util::CallOptions& options) const;

  std::shared_ptr<hours::BusinessHoursCatalog> catalog_;
  std::shared_ptr<store::AppointmentStore>     store_;
  SchedulingPolicy                             policy_;
  NowFn                                        now_;
  ScheduleBuilder                              builder_;
  ConflictDetector                             detector_;
};

} // namespace booking::scheduling
