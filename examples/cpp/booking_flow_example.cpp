#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

void PrintSlots(const std::vector<booking::model::AvailableSlot>& slots) {
  for (const auto& slot : slots) {
    std::cout << "  " << booking::model::ToString(slot.interval) << " [";
    for (std::size_t i = 0; i < slot.eligible_resource_ids.size(); ++i) {
      std::cout << (i ? "," : "") << slot.eligible_resource_ids[i];
    }
    std::cout << "]\n";
  }
}

} // namespace

int main() {
  // In-memory backend, default Monday-Friday 09:00-17:00 hours.
  booking::runtime::config::RuntimeConfig config;
  auto*                                   resource = config.add_resources();
  resource->set_id("artist-ana");
  resource->set_display_name("Ana");

  auto app = booking::factory::Build(config);

  const auto monday = booking::util::ParseTimestamp("2030-01-14T00:00Z");

  booking::model::AvailabilitySearchRequest request;
  request.range_start      = monday;
  request.range_end        = monday + booking::util::Days{1};
  request.duration_minutes = 60;

  auto slots = app.coordinator->Search(request);
  std::cout << "Monday has " << slots.size() << " free slot(s)\n";
  PrintSlots(slots);
  if (slots.empty()) {
    return 1;
  }

  // Availability is advisory: the write re-checks inside its transaction.
  const auto chosen = slots.front().interval;
  const auto id     = app.store->CreateBooking(chosen, std::string("artist-ana"), "walk-in");
  std::cout << "Booked " << id << " at " << booking::model::ToString(chosen) << "\n";

  try {
    app.store->CreateBooking(chosen, std::string("artist-ana"), "second caller");
  } catch (const booking::util::Conflict& e) {
    std::cout << "Second booking rejected: " << e.what() << "\n";
  }

  const auto alternatives = app.coordinator->SuggestAlternatives(chosen.start, 60, std::string("artist-ana"));
  std::cout << "Closest alternatives:\n";
  for (const auto& suggestion : alternatives) {
    std::cout << "  #" << suggestion.rank << " " << booking::model::ToString(suggestion.slot.interval) << " (" << suggestion.distance.count()
              << " min away)\n";
  }
  return 0;
}
