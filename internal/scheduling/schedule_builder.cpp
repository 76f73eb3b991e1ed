#include "schedule_builder.hpp"

#include <algorithm>

namespace booking::scheduling {

ScheduleBuilder::ScheduleBuilder(std::shared_ptr<store::AppointmentStore> store) : store_(std::move(store)) {
}

std::vector<model::TimeInterval> ScheduleBuilder::OpenWindows(const hours::HoursSnapshot& hours, const model::TimeInterval& range) {
  std::vector<model::TimeInterval> windows;
  if (!(range.start < range.end)) return windows;

  const auto offset    = hours.utc_offset();
  const auto first_day = util::LocalDayOf(range.start, offset);
  const auto last_day  = util::LocalDayOf(range.end - util::Clock::duration{1}, offset);

  for (auto day = first_day; day <= last_day; day += util::Days{1}) {
    for (const auto& window : hours.OpenWindowsOn(day)) {
      if (auto clipped = model::Intersection(window, range)) {
        windows.push_back(*clipped);
      }
    }
  }
  return windows;
}

std::vector<model::TimeInterval> ScheduleBuilder::Coalesce(std::vector<model::TimeInterval> intervals) {
  std::sort(intervals.begin(), intervals.end());

  std::vector<model::TimeInterval> merged;
  for (const auto& interval : intervals) {
    if (!merged.empty() && interval.start <= merged.back().end) {
      merged.back().end = std::max(merged.back().end, interval.end);
    } else {
      merged.push_back(interval);
    }
  }
  return merged;
}

std::vector<model::TimeInterval> ScheduleBuilder::Subtract(const std::vector<model::TimeInterval>& windows,
                                                           const std::vector<model::TimeInterval>& busy) {
  std::vector<model::TimeInterval> free;
  std::size_t                      first = 0;

  for (const auto& window : windows) {
    // busy and windows are both ascending; skip what ended before this window
    while (first < busy.size() && busy[first].end <= window.start) ++first;

    auto cursor = window.start;
    for (std::size_t i = first; i < busy.size() && busy[i].start < window.end; ++i) {
      if (busy[i].start > cursor) {
        free.push_back(model::TimeInterval{cursor, busy[i].start});
      }
      cursor = std::max(cursor, busy[i].end);
      if (cursor >= window.end) break;
    }
    if (cursor < window.end) {
      free.push_back(model::TimeInterval{cursor, window.end});
    }
  }
  return free;
}

FreeIntervals ScheduleBuilder::Build(const hours::HoursSnapshot& hours, const ScheduleRequest& request) const {
  FreeIntervals result;
  for (const auto& id : request.resource_ids) {
    result[id];
  }

  const auto windows = OpenWindows(hours, request.range);
  if (windows.empty() || request.resource_ids.empty()) {
    return result;
  }

  // a booking just outside the windows still eats into them through the buffer
  const model::TimeInterval read_range{windows.front().start - request.buffer, windows.back().end + request.buffer};
  const auto                bookings = store_->ListBookings(read_range, request.resource_ids, request.deadline);

  std::map<std::string, std::vector<model::TimeInterval>> busy;
  for (const auto& booking : bookings) {
    if (!booking.BlocksTime() || !booking.resource_id || !result.contains(*booking.resource_id)) continue;
    busy[*booking.resource_id].push_back(
        model::TimeInterval{booking.interval.start - request.buffer, booking.interval.end + request.buffer});
  }

  for (auto& [resource_id, free] : result) {
    const auto it = busy.find(resource_id);
    free          = it == busy.end() ? windows : Subtract(windows, Coalesce(it->second));
  }
  return result;
}

} // namespace booking::scheduling
