#include "internal/scheduling/availability_coordinator.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/counting_store.hpp"

namespace {

using booking::hours::BusinessHoursCatalog;
using booking::model::AvailabilitySearchRequest;
using booking::model::AvailableSlot;
using booking::model::TimeInterval;
using booking::model::ValidationReason;
using booking::scheduling::AvailabilityCoordinator;
using booking::scheduling::SchedulingPolicy;
using booking::testing::CountingStore;
using booking::util::Minutes;
using booking::util::ParseTimestamp;

using Intervals = std::vector<TimeInterval>;

TimeInterval At(const char* start, const char* end) {
  return TimeInterval{ParseTimestamp(start), ParseTimestamp(end)};
}

struct Fixture {
  std::shared_ptr<BusinessHoursCatalog>    catalog;
  std::shared_ptr<CountingStore>           store;
  std::unique_ptr<AvailabilityCoordinator> coordinator;
};

// Monday-Friday 09:00-17:00, clock pinned to New Year 2024.
Fixture MakeFixture(const std::vector<std::string>& resources, SchedulingPolicy policy = {}, const char* now = "2024-01-01T00:00Z") {
  Fixture fixture;
  fixture.catalog     = std::make_shared<BusinessHoursCatalog>(BusinessHoursCatalog::DefaultRules());
  fixture.store       = booking::testing::MakeCountingStore(resources);
  const auto pinned   = ParseTimestamp(now);
  fixture.coordinator = std::make_unique<AvailabilityCoordinator>(fixture.catalog, fixture.store, policy, [pinned] { return pinned; });
  return fixture;
}

AvailabilitySearchRequest MondayRequest(std::optional<std::vector<std::string>> resources, int duration = 60) {
  AvailabilitySearchRequest request;
  request.range_start      = ParseTimestamp("2024-01-15T00:00");
  request.range_end        = ParseTimestamp("2024-01-16T00:00");
  request.resource_ids     = std::move(resources);
  request.duration_minutes = duration;
  return request;
}

Intervals IntervalsOf(const std::vector<AvailableSlot>& slots) {
  Intervals out;
  for (const auto& slot : slots) out.push_back(slot.interval);
  return out;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

// ------------------------------------------------------------
// Search
// ------------------------------------------------------------

void TestMondaySearchAroundExistingBooking() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  const auto slots = fixture.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"}));

  const Intervals expected = {
      At("2024-01-15T09:00", "2024-01-15T10:00"), At("2024-01-15T11:00", "2024-01-15T12:00"), At("2024-01-15T12:00", "2024-01-15T13:00"),
      At("2024-01-15T13:00", "2024-01-15T14:00"), At("2024-01-15T14:00", "2024-01-15T15:00"), At("2024-01-15T15:00", "2024-01-15T16:00"),
      At("2024-01-15T16:00", "2024-01-15T17:00"),
  };
  assert(IntervalsOf(slots) == expected);
  for (const auto& slot : slots) {
    assert((slot.eligible_resource_ids == std::vector<std::string>{"r1"}));
    assert(slot.interval != At("2024-01-15T09:30", "2024-01-15T10:30"));
    assert(slot.interval != At("2024-01-15T10:00", "2024-01-15T11:00"));
  }
}

void TestCancelledBookingDoesNotBlockSearch() {
  auto       fixture = MakeFixture({"r1"});
  const auto id      = fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");
  fixture.store->CancelBooking(id);

  const auto slots = IntervalsOf(fixture.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"})));
  assert(slots.size() == 8);
  assert(std::find(slots.begin(), slots.end(), At("2024-01-15T10:00", "2024-01-15T11:00")) != slots.end());
}

void TestSearchIsIdempotent() {
  auto fixture = MakeFixture({"r1", "r2", "r3"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r2"), "");
  fixture.store->CreateBooking(At("2024-01-16T13:30", "2024-01-16T15:00"), std::string("r3"), "");

  AvailabilitySearchRequest request;
  request.range_start      = ParseTimestamp("2024-01-15T00:00");
  request.range_end        = ParseTimestamp("2024-01-18T00:00");
  request.duration_minutes = 30;

  const auto first  = fixture.coordinator->Search(request);
  const auto second = fixture.coordinator->Search(request);
  assert(!first.empty());
  assert(first == second);
}

void TestEverySlotHasExactDuration() {
  auto fixture = MakeFixture({"r1", "r2"});
  fixture.store->CreateBooking(At("2024-01-15T09:20", "2024-01-15T10:05"), std::string("r1"), "");
  fixture.store->CreateBooking(At("2024-01-16T15:10", "2024-01-16T16:00"), std::string("r2"), "");

  for (int duration : {15, 45, 60, 95}) {
    AvailabilitySearchRequest request;
    request.range_start      = ParseTimestamp("2024-01-15T00:00");
    request.range_end        = ParseTimestamp("2024-01-20T00:00");
    request.duration_minutes = duration;
    request.max_results      = 500;

    const auto slots = fixture.coordinator->Search(request);
    assert(!slots.empty());
    for (const auto& slot : slots) {
      assert(slot.interval.Length() == Minutes{duration});
      assert(!slot.eligible_resource_ids.empty());
    }
  }
}

void TestUnsetResourcesMeansEveryRegisteredResource() {
  auto fixture = MakeFixture({"r2", "r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  const auto slots = fixture.coordinator->Search(MondayRequest(std::nullopt));
  assert(slots.size() == 8);
  assert((slots[0].eligible_resource_ids == std::vector<std::string>{"r1", "r2"}));
  assert(slots[1].interval == At("2024-01-15T10:00", "2024-01-15T11:00"));
  assert((slots[1].eligible_resource_ids == std::vector<std::string>{"r2"}));
  assert(fixture.store->list_resources_calls == 1);
  assert(fixture.store->list_bookings_calls == 1);
}

void TestSearchRejectsMalformedRequestsBeforeAnyRead() {
  auto fixture = MakeFixture({"r1"});
  auto& coordinator = *fixture.coordinator;

  auto inverted        = MondayRequest(std::nullopt);
  inverted.range_end   = inverted.range_start;
  auto zero_duration   = MondayRequest(std::nullopt, 0);
  auto zero_results    = MondayRequest(std::nullopt);
  zero_results.max_results = 0;
  auto negative_buffer = MondayRequest(std::nullopt);
  negative_buffer.buffer_minutes = -5;
  auto zero_step       = MondayRequest(std::nullopt);
  zero_step.step_minutes = 0;
  auto empty_resource  = MondayRequest(std::vector<std::string>{""});

  for (const auto& request : {inverted, zero_duration, zero_results, negative_buffer, zero_step, empty_resource}) {
    assert(Throws<booking::util::InvalidArgument>([&] { coordinator.Search(request); }));
  }
  assert(fixture.store->Reads() == 0);
}

void TestClosedRangeReturnsNothingWithoutReading() {
  auto fixture = MakeFixture({"r1"});

  AvailabilitySearchRequest weekend;
  weekend.range_start = ParseTimestamp("2024-01-13T00:00");
  weekend.range_end   = ParseTimestamp("2024-01-15T00:00");

  assert(fixture.coordinator->Search(weekend).empty());
  assert(fixture.store->Reads() == 0);
}

void TestEmptyRosterYieldsNoSlots() {
  auto fixture = MakeFixture({});
  assert(fixture.coordinator->Search(MondayRequest(std::nullopt)).empty());
}

void TestBufferAwareSearch() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  auto request           = MondayRequest(std::vector<std::string>{"r1"});
  request.buffer_minutes = 15;

  const auto slots = IntervalsOf(fixture.coordinator->Search(request));
  assert((slots == Intervals{At("2024-01-15T11:15", "2024-01-15T12:15"), At("2024-01-15T12:30", "2024-01-15T13:30"),
                             At("2024-01-15T13:45", "2024-01-15T14:45"), At("2024-01-15T15:00", "2024-01-15T16:00")}));
}

void TestExplicitStepAndMaxResults() {
  auto fixture = MakeFixture({"r1"});

  auto request         = MondayRequest(std::vector<std::string>{"r1"});
  request.step_minutes = 30;
  request.max_results  = 3;

  const auto slots = IntervalsOf(fixture.coordinator->Search(request));
  assert((slots == Intervals{At("2024-01-15T09:00", "2024-01-15T10:00"), At("2024-01-15T09:30", "2024-01-15T10:30"),
                             At("2024-01-15T10:00", "2024-01-15T11:00")}));
}

void TestDefaultDurationComesFromPolicy() {
  SchedulingPolicy policy;
  policy.default_duration = Minutes{90};
  auto fixture            = MakeFixture({"r1"}, policy);

  AvailabilitySearchRequest request;
  request.range_start = ParseTimestamp("2024-01-15T09:00");
  request.range_end   = ParseTimestamp("2024-01-15T12:00");
  request.location_id = "downtown";

  const auto slots = fixture.coordinator->Search(request);
  assert(slots.size() == 2);
  assert(slots[0].interval.Length() == Minutes{90});
  assert(slots[1].location_id == std::optional<std::string>("downtown"));
}

void TestStoreFailureSurfacesInsteadOfEmptyResult() {
  auto fixture               = MakeFixture({"r1"});
  fixture.store->fail_reads = true;

  assert(Throws<booking::util::StoreUnavailable>(
      [&] { fixture.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"})); }));
  assert(Throws<booking::util::StoreUnavailable>([&] { fixture.coordinator->Search(MondayRequest(std::nullopt)); }));
  assert(Throws<booking::util::StoreUnavailable>(
      [&] { fixture.coordinator->IsSlotFree(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1")); }));
}

void TestTimeoutBoundsEveryStoreRead() {
  auto fixture = MakeFixture({"r1"});

  booking::util::CallOptions options;
  options.timeout     = std::chrono::milliseconds(250);
  const auto before   = booking::util::Now();
  fixture.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"}), options);
  assert(fixture.store->last_deadline.has_value());
  assert(*fixture.store->last_deadline >= before + std::chrono::milliseconds(250));

  fixture.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"}));
  assert(!fixture.store->last_deadline.has_value());

  SchedulingPolicy policy;
  policy.store_timeout = std::chrono::milliseconds(1000);
  auto bounded         = MakeFixture({"r1"}, policy);
  bounded.coordinator->Search(MondayRequest(std::vector<std::string>{"r1"}));
  assert(bounded.store->last_deadline.has_value());
}

// ------------------------------------------------------------
// Point checks
// ------------------------------------------------------------

void TestIsSlotFreeAndDetectConflicts() {
  auto       fixture = MakeFixture({"r1"});
  const auto id      = fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");
  auto&      coordinator = *fixture.coordinator;

  assert(!coordinator.IsSlotFree(At("2024-01-15T10:30", "2024-01-15T11:30"), std::string("r1")));
  assert(coordinator.IsSlotFree(At("2024-01-15T11:00", "2024-01-15T12:00"), std::string("r1")));
  assert(coordinator.IsSlotFree(At("2024-01-15T10:30", "2024-01-15T11:30"), std::string("r1"), id));

  const auto report = coordinator.DetectConflicts(At("2024-01-15T10:30", "2024-01-15T11:30"), std::nullopt);
  assert((report.BookingIds() == std::vector<std::string>{id}));
  assert(report.conflicts[0].overlap == At("2024-01-15T10:30", "2024-01-15T11:00"));

  const int reads = fixture.store->Reads();
  assert(Throws<booking::util::InvalidArgument>(
      [&] { coordinator.IsSlotFree(At("2024-01-15T11:00", "2024-01-15T11:00"), std::string("r1")); }));
  assert(fixture.store->Reads() == reads);
}

void TestUnassignedBookingBlocksOnlyResourcelessChecks() {
  auto       fixture     = MakeFixture({"r1"});
  const auto id          = fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::nullopt, "");
  auto&      coordinator = *fixture.coordinator;

  // schedules are per resource, so the unassigned booking removes no slot
  const auto slots = IntervalsOf(coordinator.Search(MondayRequest(std::nullopt)));
  assert(slots.size() == 8);
  assert(std::find(slots.begin(), slots.end(), At("2024-01-15T10:00", "2024-01-15T11:00")) != slots.end());

  assert(coordinator.IsSlotFree(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1")));
  assert(!coordinator.IsSlotFree(At("2024-01-15T10:00", "2024-01-15T11:00"), std::nullopt));
  assert((coordinator.DetectConflicts(At("2024-01-15T10:30", "2024-01-15T11:30"), std::nullopt).BookingIds() ==
          std::vector<std::string>{id}));
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void TestValidSchedulingRequest() {
  auto       fixture = MakeFixture({"r1"});
  const auto result  = fixture.coordinator->ValidateSchedulingRules(ParseTimestamp("2024-01-15T13:00"), 60, std::string("r1"));
  assert(result.valid);
  assert(result.reasons.empty());
}

void TestDurationBounds() {
  auto        fixture     = MakeFixture({"r1"});
  const auto  start       = ParseTimestamp("2024-01-15T09:00");
  const auto& coordinator = *fixture.coordinator;

  assert(coordinator.ValidateSchedulingRules(start, 0, std::nullopt).Has(ValidationReason::kDurationNotPositive));
  assert(coordinator.ValidateSchedulingRules(start, 10, std::nullopt).Has(ValidationReason::kDurationBelowMinimum));
  assert(coordinator.ValidateSchedulingRules(start, 481, std::nullopt).Has(ValidationReason::kDurationAboveMaximum));
  assert(coordinator.ValidateSchedulingRules(start, 15, std::nullopt).valid);
  assert(coordinator.ValidateSchedulingRules(start, 480, std::nullopt).valid);
}

void TestBusinessHoursContainment() {
  auto        fixture     = MakeFixture({"r1"});
  const auto& coordinator = *fixture.coordinator;

  const auto sunday = coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-14T10:00"), 60, std::nullopt);
  assert((sunday.ReasonCodes() == std::vector<std::string>{"closed_day"}));

  const auto overruns = coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T16:30"), 60, std::nullopt);
  assert((overruns.ReasonCodes() == std::vector<std::string>{"outside_business_hours"}));

  const auto early = coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T08:30"), 60, std::nullopt);
  assert(early.Has(ValidationReason::kOutsideBusinessHours));

  assert(coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T16:00"), 60, std::nullopt).valid);
}

void TestTimelinessRules() {
  SchedulingPolicy policy;
  policy.min_lead_time    = Minutes{120};
  policy.max_advance_days = 30;
  auto fixture            = MakeFixture({"r1"}, policy, "2024-01-15T12:00Z");
  const auto& coordinator = *fixture.coordinator;

  assert(coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T09:00"), 60, std::nullopt).Has(ValidationReason::kInPast));

  const auto soon = coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T13:00"), 60, std::nullopt);
  assert((soon.ReasonCodes() == std::vector<std::string>{"insufficient_lead_time"}));

  assert(coordinator.ValidateSchedulingRules(ParseTimestamp("2024-01-15T14:00"), 60, std::nullopt).valid);

  const auto far = coordinator.ValidateSchedulingRules(ParseTimestamp("2024-03-04T10:00"), 60, std::nullopt);
  assert((far.ReasonCodes() == std::vector<std::string>{"beyond_booking_horizon"}));
}

void TestConflictIsReportedAsReason() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  const auto result = fixture.coordinator->ValidateSchedulingRules(ParseTimestamp("2024-01-15T10:30"), 60, std::string("r1"));
  assert((result.ReasonCodes() == std::vector<std::string>{"conflicts_with_existing_booking"}));

  // without a resource no booking lookup happens
  const int reads = fixture.store->Reads();
  assert(fixture.coordinator->ValidateSchedulingRules(ParseTimestamp("2024-01-15T10:30"), 60, std::nullopt).valid);
  assert(fixture.store->Reads() == reads);
}

void TestEveryViolationIsReportedAtOnce() {
  auto       fixture = MakeFixture({"r1"}, {}, "2024-01-15T12:00Z");
  const auto result  = fixture.coordinator->ValidateSchedulingRules(ParseTimestamp("2024-01-14T10:00"), 5, std::nullopt);
  assert(!result.valid);
  assert((result.ReasonCodes() == std::vector<std::string>{"duration_below_minimum", "in_past", "closed_day"}));
}

// ------------------------------------------------------------
// Alternatives
// ------------------------------------------------------------

void TestSuggestAlternativesRanksByDistance() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  booking::model::AlternativeOptions options;
  options.within_days = 1;

  const auto suggestions = fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), 60, std::string("r1"), options);
  assert(suggestions.size() == 5);
  for (std::size_t i = 0; i < suggestions.size(); ++i) {
    assert(suggestions[i].rank == static_cast<int>(i + 1));
    assert(suggestions[i].distance == Minutes{60 * static_cast<int>(i + 1)});
    assert(suggestions[i].slot.interval.Length() == Minutes{60});
  }
  assert(suggestions[0].slot.interval == At("2024-01-15T11:00", "2024-01-15T12:00"));

  options.max_suggestions = 2;
  assert(fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), 60, std::string("r1"), options).size() == 2);
}

void TestSuggestAlternativesSpansDays() {
  auto fixture = MakeFixture({"r1"});

  // Friday afternoon: the weekend is skipped, Monday morning follows
  const auto suggestions = fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-19T16:00"), 60, std::string("r1"));
  assert(suggestions.size() == 5);
  assert(suggestions[0].slot.interval == At("2024-01-19T16:00", "2024-01-19T17:00"));
  assert(suggestions[0].distance == Minutes{0});
  assert(suggestions[1].slot.interval == At("2024-01-22T09:00", "2024-01-22T10:00"));
}

void TestSuggestAlternativesWithBuffer() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  booking::model::AlternativeOptions options;
  options.within_days    = 1;
  options.include_buffer = true;

  const auto suggestions = fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), 60, std::string("r1"), options);
  assert(!suggestions.empty());
  assert(suggestions[0].slot.interval == At("2024-01-15T11:15", "2024-01-15T12:15"));
  assert(suggestions[0].distance == Minutes{75});
}

void TestSuggestAlternativesEdgeCases() {
  auto fixture = MakeFixture({"r1"});

  booking::model::AlternativeOptions none;
  none.within_days = 0;
  assert(fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), 60, std::string("r1"), none).empty());
  assert(fixture.store->Reads() == 0);

  booking::model::AlternativeOptions negative;
  negative.within_days = -1;
  assert(Throws<booking::util::InvalidArgument>(
      [&] { fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), 60, std::string("r1"), negative); }));

  assert(Throws<booking::util::InvalidArgument>(
      [&] { fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-15T10:00"), -30, std::string("r1")); }));

  // nothing open in the window is a normal empty answer
  booking::model::AlternativeOptions weekend;
  weekend.within_days = 2;
  assert(fixture.coordinator->SuggestAlternatives(ParseTimestamp("2024-01-13T00:00"), 60, std::string("r1"), weekend).empty());
}

// ------------------------------------------------------------
// Next available
// ------------------------------------------------------------

void TestFindNextAvailableSkipsToNextOpenDay() {
  auto fixture = MakeFixture({"r1"});

  const auto next = fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T16:30"), 60, std::nullopt);
  assert(next.has_value());
  assert(next->slot.interval == At("2024-01-16T09:00", "2024-01-16T10:00"));
  assert(next->distance == Minutes{16 * 60 + 30});
  assert(next->rank == 1);
}

void TestFindNextAvailableStartsAtFromWithinFirstDay() {
  auto fixture = MakeFixture({"r1"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  auto next = fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T10:30"), 60, std::vector<std::string>{"r1"});
  assert(next && next->slot.interval == At("2024-01-15T11:00", "2024-01-15T12:00"));

  next = fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T09:00"), 60, std::vector<std::string>{"r1"});
  assert(next && next->slot.interval == At("2024-01-15T09:00", "2024-01-15T10:00"));
  assert(next->distance == Minutes{0});
}

void TestFindNextAvailableZeroDaysNeverReads() {
  auto fixture = MakeFixture({"r1"});
  assert(!fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T09:00"), 60, std::nullopt, 0));
  assert(fixture.store->Reads() == 0);

  assert(Throws<booking::util::InvalidArgument>(
      [&] { fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T09:00"), 60, std::nullopt, -1); }));
}

void TestFindNextAvailableIsBounded() {
  auto fixture = MakeFixture({"r1"});

  // Saturday plus Sunday are closed
  assert(!fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-13T08:00"), 60, std::nullopt, 2));
  assert(fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-13T08:00"), 60, std::nullopt, 3).has_value());

  // a calendar with no opening at all ends after max_days_to_check
  fixture.catalog->ReplaceAll({});
  assert(!fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T08:00"), 60, std::nullopt));
}

void TestFindNextAvailableHonoursCancellation() {
  auto fixture = MakeFixture({"r1"});

  booking::util::CallOptions options;
  options.cancellation.Cancel();
  assert(Throws<booking::util::Cancelled>(
      [&] { fixture.coordinator->FindNextAvailable(ParseTimestamp("2024-01-15T09:00"), 60, std::nullopt, 30, options); }));
  assert(fixture.store->Reads() == 0);
}

// ------------------------------------------------------------
// Per-resource day view
// ------------------------------------------------------------

void TestResourceAvailabilityPerResource() {
  auto fixture = MakeFixture({"r1", "r2"});
  fixture.store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  const auto day = fixture.coordinator->ResourceAvailability(booking::util::ParseDate("2024-01-15"), std::nullopt, 60);
  assert(day.size() == 2);
  assert(day.at("r1").size() == 7);
  assert(day.at("r2").size() == 8);
  for (const auto& slot : day.at("r1")) {
    assert((slot.eligible_resource_ids == std::vector<std::string>{"r1"}));
  }

  const auto only_r2 = fixture.coordinator->ResourceAvailability(booking::util::ParseDate("2024-01-14"), std::vector<std::string>{"r2"}, 60);
  assert(only_r2.size() == 1 && only_r2.at("r2").empty());
}

void TestConstructorRejectsInvalidPolicy() {
  SchedulingPolicy policy;
  policy.min_duration = Minutes{120};
  policy.max_duration = Minutes{60};

  auto catalog = std::make_shared<BusinessHoursCatalog>(BusinessHoursCatalog::DefaultRules());
  auto store   = booking::testing::MakeCountingStore({});
  assert(Throws<booking::util::InvalidArgument>([&] { AvailabilityCoordinator coordinator(catalog, store, policy); }));
  assert(Throws<booking::util::InvalidArgument>([&] { AvailabilityCoordinator coordinator(catalog, nullptr); }));
}

} // namespace

int main() {
  TestMondaySearchAroundExistingBooking();
  TestCancelledBookingDoesNotBlockSearch();
  TestSearchIsIdempotent();
  TestEverySlotHasExactDuration();
  TestUnsetResourcesMeansEveryRegisteredResource();
  TestSearchRejectsMalformedRequestsBeforeAnyRead();
  TestClosedRangeReturnsNothingWithoutReading();
  TestEmptyRosterYieldsNoSlots();
  TestBufferAwareSearch();
  TestExplicitStepAndMaxResults();
  TestDefaultDurationComesFromPolicy();
  TestStoreFailureSurfacesInsteadOfEmptyResult();
  TestTimeoutBoundsEveryStoreRead();

  TestIsSlotFreeAndDetectConflicts();
  TestUnassignedBookingBlocksOnlyResourcelessChecks();

  TestValidSchedulingRequest();
  TestDurationBounds();
  TestBusinessHoursContainment();
  TestTimelinessRules();
  TestConflictIsReportedAsReason();
  TestEveryViolationIsReportedAtOnce();

  TestSuggestAlternativesRanksByDistance();
  TestSuggestAlternativesSpansDays();
  TestSuggestAlternativesWithBuffer();
  TestSuggestAlternativesEdgeCases();

  TestFindNextAvailableSkipsToNextOpenDay();
  TestFindNextAvailableStartsAtFromWithinFirstDay();
  TestFindNextAvailableZeroDaysNeverReads();
  TestFindNextAvailableIsBounded();
  TestFindNextAvailableHonoursCancellation();

  TestResourceAvailabilityPerResource();
  TestConstructorRejectsInvalidPolicy();

  std::cout << "booking_unit_availability_coordinator: pass\n";
  return 0;
}
