#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/hours/business_hours_catalog.hpp"
#include "internal/model/time_interval.hpp"
#include "internal/store/appointment_store.hpp"

namespace booking::scheduling {

struct ScheduleRequest {
  model::TimeInterval      range;
  std::vector<std::string> resource_ids;

  // Clearance required on both sides of every booking.
  util::Minutes buffer{0};

  std::optional<util::TimePoint> deadline;
};

using FreeIntervals = std::map<std::string, std::vector<model::TimeInterval>>;

/*
  ScheduleBuilder

  Business-open windows minus booked time, per resource. One batched store
  read per Build(); no read at all when the range has no open window.
*/
class ScheduleBuilder {
 public:
  explicit ScheduleBuilder(std::shared_ptr<store::AppointmentStore> store);

  // Every requested resource gets an entry, possibly empty. Intervals are
  // ascending and pairwise disjoint.
  FreeIntervals Build(const hours::HoursSnapshot& hours, const ScheduleRequest& request) const;

  // Open windows of every local day touching range, clipped to range.
  static std::vector<model::TimeInterval> OpenWindows(const hours::HoursSnapshot& hours, const model::TimeInterval& range);

  // Sorts and merges overlapping or touching intervals.
  static std::vector<model::TimeInterval> Coalesce(std::vector<model::TimeInterval> intervals);

  // windows minus busy; busy must already be coalesced.
  static std::vector<model::TimeInterval> Subtract(const std::vector<model::TimeInterval>& windows, const std::vector<model::TimeInterval>& busy);

 private:
  std::shared_ptr<store::AppointmentStore> store_;
};

} // namespace booking::scheduling
