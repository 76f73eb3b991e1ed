#include "availability_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/scheduling/slot_enumerator.hpp"
#include "internal/util/errors.hpp"

namespace booking::scheduling {

namespace {

template <typename Fn>
auto ObserveOperation(std::string_view operation, Fn&& fn) {
  observability::SpanScope span(operation);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(operation, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BOOKING_LOG_ERROR("Scheduling operation failed",
                      {observability::StringField("operation", operation), observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

std::optional<std::vector<std::string>> SingleResource(const std::optional<std::string>& resource_id) {
  if (!resource_id) return std::nullopt;
  return std::vector<std::string>{*resource_id};
}

void CheckInterval(const model::TimeInterval& interval) {
  if (!(interval.start < interval.end)) {
    throw util::InvalidArgument("interval must satisfy start < end: " + model::ToString(interval));
  }
}

} // namespace

AvailabilityCoordinator::AvailabilityCoordinator(std::shared_ptr<hours::BusinessHoursCatalog> catalog, std::shared_ptr<store::AppointmentStore> store,
                                                 SchedulingPolicy policy, NowFn now)
    : catalog_(std::move(catalog)),
      store_(std::move(store)),
      policy_(std::move(policy)),
      now_(std::move(now)),
      builder_(store_),
      detector_(store_) {
  if (!catalog_ || !store_) {
    throw util::InvalidArgument("AvailabilityCoordinator requires a catalog and a store");
  }
  const auto errors = policy_.Validate();
  if (!errors.empty()) {
    throw util::InvalidArgument("invalid scheduling policy: " + errors.front());
  }
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

util::Minutes AvailabilityCoordinator::ResolveDuration(std::optional<int> duration_minutes) const {
  const auto duration = duration_minutes ? util::Minutes(*duration_minutes) : policy_.default_duration;
  if (duration <= util::Minutes{0}) {
    throw util::InvalidArgument("duration_minutes must be positive, got " + std::to_string(duration.count()));
  }
  return duration;
}

AvailabilityCoordinator::SearchPlan AvailabilityCoordinator::Plan(const model::AvailabilitySearchRequest& request) const {
  if (!(request.range_start < request.range_end)) {
    throw util::InvalidArgument("range_start must be before range_end");
  }

  SearchPlan plan;
  plan.range    = model::TimeInterval{request.range_start, request.range_end};
  plan.duration = ResolveDuration(request.duration_minutes);

  const int max_results = request.max_results.value_or(policy_.default_max_results);
  if (max_results <= 0) {
    throw util::InvalidArgument("max_results must be positive, got " + std::to_string(max_results));
  }
  plan.max_results = static_cast<std::size_t>(max_results);

  if (request.buffer_minutes) {
    if (*request.buffer_minutes < 0) {
      throw util::InvalidArgument("buffer_minutes must not be negative");
    }
    plan.buffer = util::Minutes(*request.buffer_minutes);
  }

  if (request.step_minutes) {
    if (*request.step_minutes <= 0) {
      throw util::InvalidArgument("step_minutes must be positive");
    }
    plan.step = util::Minutes(*request.step_minutes);
  } else if (policy_.slot_step > util::Minutes{0}) {
    plan.step = policy_.slot_step;
  } else {
    plan.step = plan.duration + plan.buffer;
  }

  plan.location_id = request.location_id;
  return plan;
}

std::vector<std::string> AvailabilityCoordinator::ResolveResources(const std::optional<std::vector<std::string>>& requested,
                                                                   const util::CallOptions&                       options) const {
  std::vector<std::string> resources;
  if (requested) {
    resources = *requested;
    if (std::any_of(resources.begin(), resources.end(), [](const std::string& id) { return id.empty(); })) {
      throw util::InvalidArgument("resource ids must not be empty");
    }
  } else {
    for (const auto& resource : store_->ListResources(StoreDeadline(options))) {
      resources.push_back(resource.id);
    }
  }

  std::sort(resources.begin(), resources.end());
  resources.erase(std::unique(resources.begin(), resources.end()), resources.end());
  return resources;
}

std::vector<model::AvailableSlot> AvailabilityCoordinator::Run(const hours::HoursSnapshot& hours, const SearchPlan& plan,
                                                               const std::vector<std::string>& resources, const util::CallOptions& options) const {
  ScheduleRequest schedule;
  schedule.range        = plan.range;
  schedule.resource_ids = resources;
  schedule.buffer       = plan.buffer;
  schedule.deadline     = StoreDeadline(options);

  EnumerationOptions enumeration;
  enumeration.duration    = plan.duration;
  enumeration.step        = plan.step;
  enumeration.max_results = plan.max_results;
  enumeration.location_id = plan.location_id;

  return SlotEnumerator::Enumerate(builder_.Build(hours, schedule), enumeration);
}

std::optional<util::TimePoint> AvailabilityCoordinator::StoreDeadline(const util::CallOptions& options) const {
  if (auto deadline = options.DeadlineFromNow()) return deadline;
  if (policy_.store_timeout) return util::Now() + *policy_.store_timeout;
  return std::nullopt;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<model::AvailableSlot> AvailabilityCoordinator::Search(const model::AvailabilitySearchRequest& request,
                                                                  const util::CallOptions&                options) const {
  return ObserveOperation("AvailabilityCoordinator.Search", [&] {
    const auto plan  = Plan(request);
    const auto hours = catalog_->Snapshot();
    if (ScheduleBuilder::OpenWindows(*hours, plan.range).empty()) {
      return std::vector<model::AvailableSlot>{};
    }

    auto slots = Run(*hours, plan, ResolveResources(request.resource_ids, options), options);
    observability::Metrics::Instance().ObserveSlotsReturned("AvailabilityCoordinator.Search", slots.size());
    return slots;
  });
}

bool AvailabilityCoordinator::IsSlotFree(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                         const std::optional<std::string>& exclude_booking_id, const util::CallOptions& options) const {
  return ObserveOperation("AvailabilityCoordinator.IsSlotFree", [&] {
    CheckInterval(interval);
    return detector_.Detect(interval, resource_id, exclude_booking_id, StoreDeadline(options)).empty();
  });
}

model::ConflictReport AvailabilityCoordinator::DetectConflicts(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                                               const std::optional<std::string>& exclude_booking_id,
                                                               const util::CallOptions&          options) const {
  return ObserveOperation("AvailabilityCoordinator.DetectConflicts", [&] {
    CheckInterval(interval);
    return detector_.Detect(interval, resource_id, exclude_booking_id, StoreDeadline(options));
  });
}

model::ValidationResult AvailabilityCoordinator::ValidateSchedulingRules(util::TimePoint start, int duration_minutes,
                                                                         const std::optional<std::string>& resource_id,
                                                                         const util::CallOptions&          options) const {
  return ObserveOperation("AvailabilityCoordinator.ValidateSchedulingRules", [&] {
    using model::ValidationReason;
    model::ValidationResult result;

    const util::Minutes duration(duration_minutes);
    if (duration <= util::Minutes{0}) {
      result.Add(ValidationReason::kDurationNotPositive);
    } else if (duration < policy_.min_duration) {
      result.Add(ValidationReason::kDurationBelowMinimum);
    } else if (duration > policy_.max_duration) {
      result.Add(ValidationReason::kDurationAboveMaximum);
    }

    const auto now = now_();
    if (start < now) {
      result.Add(ValidationReason::kInPast);
    } else if (policy_.min_lead_time > util::Minutes{0} && start < now + policy_.min_lead_time) {
      result.Add(ValidationReason::kInsufficientLeadTime);
    }
    if (policy_.max_advance_days > 0 && start > now + util::Days{policy_.max_advance_days}) {
      result.Add(ValidationReason::kBeyondBookingHorizon);
    }

    const auto hours = catalog_->Snapshot();
    const auto day   = util::LocalDayOf(start, hours->utc_offset());
    if (!hours->HoursOn(day)) {
      result.Add(ValidationReason::kClosedDay);
    } else if (duration > util::Minutes{0}) {
      const model::TimeInterval interval{start, start + duration};
      const auto                windows = hours->OpenWindowsOn(day);
      const bool                inside =
          std::any_of(windows.begin(), windows.end(), [&](const model::TimeInterval& window) { return window.Contains(interval); });
      if (!inside) {
        result.Add(ValidationReason::kOutsideBusinessHours);
      }
    }

    if (resource_id && duration > util::Minutes{0}) {
      const model::TimeInterval interval{start, start + duration};
      if (!detector_.Detect(interval, resource_id, std::nullopt, StoreDeadline(options)).empty()) {
        result.Add(ValidationReason::kConflictsWithExistingBooking);
      }
    }

    return result;
  });
}

std::vector<model::SuggestedSlot> AvailabilityCoordinator::SuggestAlternatives(util::TimePoint preferred_start, std::optional<int> duration_minutes,
                                                                               const std::optional<std::string>& resource_id,
                                                                               const model::AlternativeOptions&  alternatives,
                                                                               const util::CallOptions&          options) const {
  return ObserveOperation("AvailabilityCoordinator.SuggestAlternatives", [&] {
    const int within_days     = alternatives.within_days.value_or(policy_.suggestion_within_days);
    const int max_suggestions = alternatives.max_suggestions.value_or(policy_.max_suggestions);
    if (within_days < 0) {
      throw util::InvalidArgument("within_days must not be negative");
    }
    if (max_suggestions <= 0) {
      throw util::InvalidArgument("max_suggestions must be positive");
    }

    model::AvailabilitySearchRequest request;
    request.range_start      = preferred_start;
    request.range_end        = preferred_start + util::Days{within_days};
    request.resource_ids     = SingleResource(resource_id);
    request.duration_minutes = static_cast<int>(ResolveDuration(duration_minutes).count());
    request.max_results      = max_suggestions;
    if (alternatives.include_buffer) {
      request.buffer_minutes = static_cast<int>(policy_.default_buffer.count());
    }

    std::vector<model::SuggestedSlot> suggestions;
    if (within_days == 0) {
      return suggestions;
    }

    const auto plan  = Plan(request);
    const auto hours = catalog_->Snapshot();
    if (ScheduleBuilder::OpenWindows(*hours, plan.range).empty()) {
      return suggestions;
    }

    for (auto& slot : Run(*hours, plan, ResolveResources(request.resource_ids, options), options)) {
      const auto start    = slot.interval.start;
      const auto distance = std::chrono::duration_cast<std::chrono::minutes>(start >= preferred_start ? start - preferred_start : preferred_start - start);
      suggestions.push_back(model::SuggestedSlot{std::move(slot), 0, distance});
    }

    std::stable_sort(suggestions.begin(), suggestions.end(), [](const model::SuggestedSlot& a, const model::SuggestedSlot& b) {
      if (a.distance != b.distance) return a.distance < b.distance;
      return a.slot.interval.start < b.slot.interval.start;
    });
    if (suggestions.size() > static_cast<std::size_t>(max_suggestions)) {
      suggestions.resize(static_cast<std::size_t>(max_suggestions));
    }
    for (std::size_t i = 0; i < suggestions.size(); ++i) {
      suggestions[i].rank = static_cast<int>(i + 1);
    }
    return suggestions;
  });
}

std::optional<model::SuggestedSlot> AvailabilityCoordinator::FindNextAvailable(util::TimePoint from, std::optional<int> duration_minutes,
                                                                               const std::optional<std::vector<std::string>>& resource_ids,
                                                                               std::optional<int> max_days_to_check, const util::CallOptions& options) const {
  return ObserveOperation("AvailabilityCoordinator.FindNextAvailable", [&]() -> std::optional<model::SuggestedSlot> {
    const auto duration = ResolveDuration(duration_minutes);
    const int  max_days = max_days_to_check.value_or(policy_.max_days_to_check);
    if (max_days < 0) {
      throw util::InvalidArgument("max_days_to_check must not be negative");
    }
    if (max_days == 0) {
      return std::nullopt;
    }

    const auto hours     = catalog_->Snapshot();
    const auto offset    = hours->utc_offset();
    const auto first_day = util::LocalDayOf(from, offset);

    std::optional<std::vector<std::string>> resources;
    for (int i = 0; i < max_days; ++i) {
      if (options.cancellation.IsCancelled()) {
        throw util::Cancelled("FindNextAvailable cancelled after " + std::to_string(i) + " day(s)");
      }

      const auto day = first_day + util::Days{i};
      model::AvailabilitySearchRequest request;
      request.range_start      = i == 0 ? from : util::LocalMidnight(day, offset);
      request.range_end        = util::LocalMidnight(day + util::Days{1}, offset);
      request.duration_minutes = static_cast<int>(duration.count());
      request.max_results      = 1;

      const auto plan = Plan(request);
      if (ScheduleBuilder::OpenWindows(*hours, plan.range).empty()) {
        continue;
      }
      if (!resources) {
        resources = ResolveResources(resource_ids, options);
      }

      auto slots = Run(*hours, plan, *resources, options);
      if (!slots.empty()) {
        const auto distance = std::chrono::duration_cast<std::chrono::minutes>(slots.front().interval.start - from);
        return model::SuggestedSlot{std::move(slots.front()), 1, distance};
      }
    }
    return std::nullopt;
  });
}

std::map<std::string, std::vector<model::AvailableSlot>> AvailabilityCoordinator::ResourceAvailability(
    util::LocalDays day, const std::optional<std::vector<std::string>>& resource_ids, std::optional<int> duration_minutes,
    const util::CallOptions& options) const {
  return ObserveOperation("AvailabilityCoordinator.ResourceAvailability", [&] {
    const auto duration = ResolveDuration(duration_minutes);
    const auto hours    = catalog_->Snapshot();
    const auto offset   = hours->utc_offset();

    ScheduleRequest schedule;
    schedule.range        = model::TimeInterval{util::LocalMidnight(day, offset), util::LocalMidnight(day + util::Days{1}, offset)};
    schedule.resource_ids = ResolveResources(resource_ids, options);
    schedule.deadline     = StoreDeadline(options);

    EnumerationOptions enumeration;
    enumeration.duration    = duration;
    enumeration.step        = policy_.slot_step > util::Minutes{0} ? policy_.slot_step : duration;
    enumeration.max_results = static_cast<std::size_t>(policy_.default_max_results);

    std::map<std::string, std::vector<model::AvailableSlot>> availability;
    for (auto& [resource_id, free] : builder_.Build(*hours, schedule)) {
      availability[resource_id] = SlotEnumerator::Enumerate(FreeIntervals{{resource_id, std::move(free)}}, enumeration);
    }
    return availability;
  });
}

} // namespace booking::scheduling
