#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace booking::util {

/*
  Time utilities: single place to control clock source and the
  textual timestamp format used by configuration and the CLI.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Minutes   = std::chrono::minutes;
using Days      = std::chrono::days;
using LocalDays = std::chrono::sys_days; // calendar day in business-local time

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Accepts "YYYY-MM-DDTHH:MM[:SS][Z|+HH:MM|-HH:MM]"; a missing offset means UTC.
TimePoint   ParseTimestamp(std::string_view text);
std::string FormatTimestamp(TimePoint tp);

// "YYYY-MM-DD"
LocalDays   ParseDate(std::string_view text);
std::string FormatDate(LocalDays day);

// 0 = Sunday ... 6 = Saturday
unsigned DayOfWeek(LocalDays day);

// Conversions between instants and a business-local wall clock with a fixed UTC offset.
LocalDays LocalDayOf(TimePoint tp, Minutes utc_offset);
TimePoint LocalMidnight(LocalDays day, Minutes utc_offset);

} // namespace booking::util
