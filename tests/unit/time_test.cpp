#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using booking::util::DayOfWeek;
using booking::util::FormatDate;
using booking::util::FormatTimestamp;
using booking::util::LocalDayOf;
using booking::util::LocalMidnight;
using booking::util::Minutes;
using booking::util::ParseDate;
using booking::util::ParseTimestamp;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const booking::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestParseTimestampAcceptsOffsetsAndSeconds() {
  const auto utc = ParseTimestamp("2024-01-15T10:00Z");
  assert(FormatTimestamp(utc) == "2024-01-15T10:00:00Z");

  assert(ParseTimestamp("2024-01-15T10:00") == utc);
  assert(ParseTimestamp("2024-01-15 10:00:00") == utc);
  assert(ParseTimestamp("2024-01-15T11:30+01:30") == utc);
  assert(ParseTimestamp("2024-01-15T05:00-05:00") == utc);
  assert(FormatTimestamp(ParseTimestamp("2024-01-15T10:00:42Z")) == "2024-01-15T10:00:42Z");
}

void TestParseTimestampRejectsMalformedInput() {
  assert(ThrowsInvalidArgument([] { ParseTimestamp("2024-01-15"); }));
  assert(ThrowsInvalidArgument([] { ParseTimestamp("2024-01-15T24:00"); }));
  assert(ThrowsInvalidArgument([] { ParseTimestamp("2024-01-15T10:60"); }));
  assert(ThrowsInvalidArgument([] { ParseTimestamp("2024-01-15T10:00Zjunk"); }));
  assert(ThrowsInvalidArgument([] { ParseTimestamp("2024-01-15T10:00+0100"); }));
}

void TestParseDateValidatesCalendar() {
  assert(FormatDate(ParseDate("2024-02-29")) == "2024-02-29");
  assert(ThrowsInvalidArgument([] { ParseDate("2023-02-29"); }));
  assert(ThrowsInvalidArgument([] { ParseDate("2024-13-01"); }));
  assert(ThrowsInvalidArgument([] { ParseDate("2024-1-01"); }));
}

void TestDayOfWeekUsesSundayZero() {
  assert(DayOfWeek(ParseDate("2024-01-14")) == 0);
  assert(DayOfWeek(ParseDate("2024-01-15")) == 1);
  assert(DayOfWeek(ParseDate("2024-01-20")) == 6);
}

void TestLocalDayHonoursUtcOffset() {
  const auto late_evening_utc = ParseTimestamp("2024-01-15T23:30Z");
  assert(LocalDayOf(late_evening_utc, Minutes{0}) == ParseDate("2024-01-15"));
  assert(LocalDayOf(late_evening_utc, Minutes{60}) == ParseDate("2024-01-16"));
  assert(LocalDayOf(late_evening_utc, Minutes{-60 * 5}) == ParseDate("2024-01-15"));

  assert(LocalMidnight(ParseDate("2024-01-16"), Minutes{60}) == ParseTimestamp("2024-01-15T23:00Z"));
  assert(LocalMidnight(ParseDate("2024-01-16"), Minutes{-300}) == ParseTimestamp("2024-01-16T05:00Z"));
}

void TestUnixMillisRoundTrip() {
  const auto tp = ParseTimestamp("2024-01-15T10:00:01Z");
  assert(booking::util::ToUnixMillis(tp) == 1705312801000LL);
  assert(booking::util::FromUnixMillis(1705312801000LL) == tp);
}

void TestBookingIdsAreVersion4Uuids() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = booking::util::NewBookingId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(seen.insert(id).second);
    assert(booking::util::ToString(booking::util::FromString(id)) == id);
  }
}

void TestCancellationTokenCopiesShareState() {
  booking::util::CallOptions options;
  const auto                 copy = options.cancellation;
  assert(!copy.IsCancelled());

  options.cancellation.Cancel();
  assert(copy.IsCancelled());
  assert(!options.DeadlineFromNow());

  options.timeout = std::chrono::milliseconds(500);
  assert(options.DeadlineFromNow().has_value());
}

} // namespace

int main() {
  TestParseTimestampAcceptsOffsetsAndSeconds();
  TestParseTimestampRejectsMalformedInput();
  TestParseDateValidatesCalendar();
  TestDayOfWeekUsesSundayZero();
  TestLocalDayHonoursUtcOffset();
  TestUnixMillisRoundTrip();
  TestBookingIdsAreVersion4Uuids();
  TestCancellationTokenCopiesShareState();

  std::cout << "booking_unit_time: pass\n";
  return 0;
}
