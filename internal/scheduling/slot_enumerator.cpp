#include "slot_enumerator.hpp"

#include <map>
#include <set>

#include "internal/util/errors.hpp"

namespace booking::scheduling {

std::vector<model::TimeInterval> SlotEnumerator::Slice(const std::vector<model::TimeInterval>& free, util::Minutes duration, util::Minutes step,
                                                       std::size_t limit) {
  if (duration <= util::Minutes{0} || step <= util::Minutes{0}) {
    throw util::InvalidArgument("slot duration and step must be positive");
  }

  std::vector<model::TimeInterval> slots;
  for (const auto& interval : free) {
    for (auto start = interval.start; start + duration <= interval.end; start += step) {
      if (slots.size() >= limit) return slots;
      slots.push_back(model::TimeInterval{start, start + duration});
    }
  }
  return slots;
}

std::vector<model::AvailableSlot> SlotEnumerator::Enumerate(const FreeIntervals& free_by_resource, const EnumerationOptions& options) {
  // Each resource contributes at most max_results candidates: anything past
  // its own first max_results can never make the global cut.
  std::map<model::TimeInterval, std::set<std::string>> merged;
  for (const auto& [resource_id, free] : free_by_resource) {
    for (const auto& interval : Slice(free, options.duration, options.step, options.max_results)) {
      merged[interval].insert(resource_id);
    }
  }

  std::vector<model::AvailableSlot> slots;
  for (const auto& [interval, resources] : merged) {
    if (slots.size() >= options.max_results) break;

    model::AvailableSlot slot;
    slot.interval = interval;
    slot.eligible_resource_ids.assign(resources.begin(), resources.end());
    slot.location_id = options.location_id;
    slots.push_back(std::move(slot));
  }
  return slots;
}

} // namespace booking::scheduling
