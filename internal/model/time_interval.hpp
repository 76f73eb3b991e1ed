#pragma once

#include <compare>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace booking::model {

/*
  Half-open interval [start, end). Intervals that only touch at a boundary
  do not overlap.
*/
struct TimeInterval {
  util::TimePoint start{};
  util::TimePoint end{};

  util::Clock::duration Length() const {
    return end - start;
  }

  bool Contains(util::TimePoint tp) const {
    return start <= tp && tp < end;
  }

  bool Contains(const TimeInterval& other) const {
    return start <= other.start && other.end <= end;
  }

  auto operator<=>(const TimeInterval&) const = default;
};

// Throws InvalidArgument unless start < end.
TimeInterval MakeInterval(util::TimePoint start, util::TimePoint end);

inline TimeInterval MakeInterval(util::TimePoint start, util::Minutes length) {
  return MakeInterval(start, start + length);
}

// The one overlap test used everywhere.
constexpr bool Overlaps(const TimeInterval& a, const TimeInterval& b) {
  return a.start < b.end && b.start < a.end;
}

std::optional<TimeInterval> Intersection(const TimeInterval& a, const TimeInterval& b);

std::string ToString(const TimeInterval& interval);

} // namespace booking::model
