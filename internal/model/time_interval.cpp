#include "time_interval.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace booking::model {

TimeInterval MakeInterval(util::TimePoint start, util::TimePoint end) {
  if (!(start < end)) {
    throw util::InvalidArgument("interval start must precede end: " + util::FormatTimestamp(start) + " .. " + util::FormatTimestamp(end));
  }
  return TimeInterval{start, end};
}

std::optional<TimeInterval> Intersection(const TimeInterval& a, const TimeInterval& b) {
  if (!Overlaps(a, b)) return std::nullopt;
  return TimeInterval{std::max(a.start, b.start), std::min(a.end, b.end)};
}

std::string ToString(const TimeInterval& interval) {
  return "[" + util::FormatTimestamp(interval.start) + ", " + util::FormatTimestamp(interval.end) + ")";
}

} // namespace booking::model
