#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <string>

#include "internal/util/errors.hpp"

namespace booking::util {

namespace {

bool ReadDigits(std::string_view text, std::size_t pos, std::size_t count, int* out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    value = value * 10 + (text[i] - '0');
  }
  *out = value;
  return true;
}

LocalDays CheckedDate(int y, int m, int d, std::string_view text) {
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    throw InvalidArgument("invalid calendar date: " + std::string(text));
  }
  return LocalDays{ymd};
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

LocalDays ParseDate(std::string_view text) {
  int y = 0, m = 0, d = 0;
  if (text.size() != 10 || !ReadDigits(text, 0, 4, &y) || text[4] != '-' || !ReadDigits(text, 5, 2, &m) || text[7] != '-' ||
      !ReadDigits(text, 8, 2, &d)) {
    throw InvalidArgument("expected YYYY-MM-DD, got '" + std::string(text) + "'");
  }
  return CheckedDate(y, m, d, text);
}

std::string FormatDate(LocalDays day) {
  const std::chrono::year_month_day ymd{day};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

TimePoint ParseTimestamp(std::string_view text) {
  if (text.size() < 16 || (text[10] != 'T' && text[10] != ' ')) {
    throw InvalidArgument("expected YYYY-MM-DDTHH:MM timestamp, got '" + std::string(text) + "'");
  }

  const auto day = ParseDate(text.substr(0, 10));

  int hh = 0, mm = 0, ss = 0;
  if (!ReadDigits(text, 11, 2, &hh) || text[13] != ':' || !ReadDigits(text, 14, 2, &mm) || hh > 23 || mm > 59) {
    throw InvalidArgument("invalid time of day in '" + std::string(text) + "'");
  }

  std::size_t pos = 16;
  if (pos < text.size() && text[pos] == ':') {
    if (!ReadDigits(text, pos + 1, 2, &ss) || ss > 59) {
      throw InvalidArgument("invalid seconds in '" + std::string(text) + "'");
    }
    pos += 3;
  }

  std::chrono::minutes offset{0};
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z' && pos + 1 == text.size()) {
      pos += 1;
    } else if ((sign == '+' || sign == '-') && pos + 6 == text.size()) {
      int oh = 0, om = 0;
      if (!ReadDigits(text, pos + 1, 2, &oh) || text[pos + 3] != ':' || !ReadDigits(text, pos + 4, 2, &om)) {
        throw InvalidArgument("invalid UTC offset in '" + std::string(text) + "'");
      }
      offset = std::chrono::hours(oh) + std::chrono::minutes(om);
      if (sign == '-') offset = -offset;
      pos += 6;
    } else {
      throw InvalidArgument("trailing characters in timestamp '" + std::string(text) + "'");
    }
  }

  const auto local = TimePoint{day} + std::chrono::hours(hh) + std::chrono::minutes(mm) + std::chrono::seconds(ss);
  return local - offset;
}

std::string FormatTimestamp(TimePoint tp) {
  const auto day  = std::chrono::floor<Days>(tp);
  const auto time = std::chrono::hh_mm_ss{std::chrono::floor<std::chrono::seconds>(tp - day)};
  char       buf[16];
  std::snprintf(buf, sizeof(buf), "T%02d:%02d:%02dZ", static_cast<int>(time.hours().count()), static_cast<int>(time.minutes().count()),
                static_cast<int>(time.seconds().count()));
  return FormatDate(LocalDays{day}) + buf;
}

unsigned DayOfWeek(LocalDays day) {
  return std::chrono::weekday{day}.c_encoding();
}

LocalDays LocalDayOf(TimePoint tp, Minutes utc_offset) {
  return std::chrono::floor<Days>(tp + utc_offset);
}

TimePoint LocalMidnight(LocalDays day, Minutes utc_offset) {
  return TimePoint{day} - utc_offset;
}

} // namespace booking::util
