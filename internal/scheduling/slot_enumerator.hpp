#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/availability.hpp"
#include "internal/scheduling/schedule_builder.hpp"

namespace booking::scheduling {

struct EnumerationOptions {
  util::Minutes              duration{60};
  util::Minutes              step{60};
  std::size_t                max_results = 50;
  std::optional<std::string> location_id;
};

/*
  SlotEnumerator

  Slices free intervals into slots of exactly `duration`, starting at each
  free interval's start and advancing by `step`. Resources free for the
  same interval share one AvailableSlot. Output is chronological, and
  max_results is a silent global cap.
*/
class SlotEnumerator {
 public:
  // At most limit slot intervals inside the given free intervals.
  static std::vector<model::TimeInterval> Slice(const std::vector<model::TimeInterval>& free, util::Minutes duration, util::Minutes step,
                                                std::size_t limit);

  static std::vector<model::AvailableSlot> Enumerate(const FreeIntervals& free_by_resource, const EnumerationOptions& options);
};

} // namespace booking::scheduling
