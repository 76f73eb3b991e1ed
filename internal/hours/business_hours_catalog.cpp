#include "business_hours_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace booking::hours {

namespace {

constexpr unsigned      kDaysPerWeek = 7;
constexpr util::Minutes kEndOfDay{24 * 60};

void CheckDay(unsigned day_of_week) {
  if (day_of_week >= kDaysPerWeek) {
    throw util::InvalidArgument("day_of_week must be 0..6, got " + std::to_string(day_of_week));
  }
}

std::vector<BreakPeriod> SortedBreaks(std::vector<BreakPeriod> breaks) {
  std::sort(breaks.begin(), breaks.end(), [](const BreakPeriod& a, const BreakPeriod& b) { return a.start < b.start; });
  return breaks;
}

} // namespace

util::Minutes ParseTimeOfDay(std::string_view text, bool allow_end_of_day) {
  // H:MM or HH:MM
  const auto colon = text.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
    throw util::InvalidArgument("expected HH:MM, got '" + std::string(text) + "'");
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw util::InvalidArgument("expected HH:MM, got '" + std::string(text) + "'");
    }
  }

  const int hours   = std::stoi(std::string(text.substr(0, colon)));
  const int minutes = std::stoi(std::string(text.substr(colon + 1)));

  if (allow_end_of_day && hours == 24 && minutes == 0) {
    return kEndOfDay;
  }
  if (hours > 23 || minutes > 59) {
    throw util::InvalidArgument("time of day out of range: '" + std::string(text) + "'");
  }
  return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}

std::string FormatTimeOfDay(util::Minutes time_of_day) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", static_cast<int>(time_of_day.count() / 60), static_cast<int>(time_of_day.count() % 60));
  return buf;
}

// ------------------------------------------------------------
// HoursSnapshot
// ------------------------------------------------------------

HoursSnapshot::HoursSnapshot(const std::vector<BusinessHoursRule>& rules, const std::vector<SpecialDay>& special_days, util::Minutes utc_offset)
    : utc_offset_(utc_offset) {
  for (const auto& rule : rules) {
    CheckDay(rule.day_of_week);
    auto copy   = rule;
    copy.breaks = SortedBreaks(rule.breaks);
    weekly_[rule.day_of_week] = std::move(copy);
  }
  for (const auto& special : special_days) {
    special_days_[special.date] = special;
  }
}

std::optional<BusinessHoursRule> HoursSnapshot::HoursFor(unsigned day_of_week) const {
  CheckDay(day_of_week);
  return weekly_[day_of_week];
}

bool HoursSnapshot::IsOpen(unsigned day_of_week) const {
  const auto rule = HoursFor(day_of_week);
  return rule && rule->is_open;
}

std::optional<BusinessHoursRule> HoursSnapshot::HoursOn(util::LocalDays date) const {
  const unsigned day_of_week = util::DayOfWeek(date);

  if (auto it = special_days_.find(date); it != special_days_.end()) {
    const auto& special = it->second;
    if (special.is_closed) return std::nullopt;

    BusinessHoursRule rule;
    rule.day_of_week = day_of_week;
    rule.open_time   = special.open_time;
    rule.close_time  = special.close_time;
    rule.is_open     = true;
    return rule;
  }

  const auto& rule = weekly_[day_of_week];
  if (!rule || !rule->is_open) return std::nullopt;
  return rule;
}

std::vector<model::TimeInterval> HoursSnapshot::OpenWindowsOn(util::LocalDays date) const {
  std::vector<model::TimeInterval> windows;

  const auto rule = HoursOn(date);
  if (!rule) return windows;

  const auto midnight = util::LocalMidnight(date, utc_offset_);
  auto       cursor   = rule->open_time;
  for (const auto& brk : rule->breaks) {
    if (brk.end <= cursor) continue;
    if (brk.start >= rule->close_time) break;
    if (brk.start > cursor) {
      windows.push_back(model::TimeInterval{midnight + cursor, midnight + brk.start});
    }
    cursor = std::max(cursor, brk.end);
  }
  if (cursor < rule->close_time) {
    windows.push_back(model::TimeInterval{midnight + cursor, midnight + rule->close_time});
  }
  return windows;
}

std::vector<BusinessHoursRule> HoursSnapshot::Rules() const {
  std::vector<BusinessHoursRule> rules;
  for (const auto& rule : weekly_) {
    if (rule) rules.push_back(*rule);
  }
  return rules;
}

std::vector<SpecialDay> HoursSnapshot::SpecialDays() const {
  std::vector<SpecialDay> days;
  days.reserve(special_days_.size());
  for (const auto& [_, special] : special_days_) {
    days.push_back(special);
  }
  return days;
}

// ------------------------------------------------------------
// BusinessHoursCatalog
// ------------------------------------------------------------

BusinessHoursCatalog::BusinessHoursCatalog()
    : snapshot_(std::make_shared<const HoursSnapshot>(std::vector<BusinessHoursRule>{}, std::vector<SpecialDay>{}, util::Minutes{0})) {
}

BusinessHoursCatalog::BusinessHoursCatalog(std::vector<BusinessHoursRule> rules, std::vector<SpecialDay> special_days, util::Minutes utc_offset)
    : BusinessHoursCatalog() {
  ReplaceAll(std::move(rules), std::move(special_days), utc_offset);
}

std::optional<BusinessHoursRule> BusinessHoursCatalog::HoursFor(unsigned day_of_week) const {
  return Snapshot()->HoursFor(day_of_week);
}

bool BusinessHoursCatalog::IsOpen(unsigned day_of_week) const {
  return Snapshot()->IsOpen(day_of_week);
}

void BusinessHoursCatalog::ReplaceAll(std::vector<BusinessHoursRule> rules, std::vector<SpecialDay> special_days,
                                      std::optional<util::Minutes> utc_offset) {
  const auto problems = Validate(rules, special_days);
  if (!problems.empty()) {
    throw util::InvalidArgument("invalid business hours: " + problems.front());
  }

  const auto offset = utc_offset ? *utc_offset : Snapshot()->utc_offset();
  auto       next   = std::make_shared<const HoursSnapshot>(rules, special_days, offset);

  {
    std::unique_lock lock(mutex_);
    snapshot_ = std::move(next);
  }

  BOOKING_LOG_INFO("Business hours replaced", {observability::IntField("rules", static_cast<int64_t>(rules.size())),
                                               observability::IntField("special_days", static_cast<int64_t>(special_days.size())),
                                               observability::IntField("utc_offset_minutes", offset.count())});
}

std::shared_ptr<const HoursSnapshot> BusinessHoursCatalog::Snapshot() const {
  std::shared_lock lock(mutex_);
  return snapshot_;
}

std::vector<std::string> BusinessHoursCatalog::Validate(const std::vector<BusinessHoursRule>& rules, const std::vector<SpecialDay>& special_days) {
  std::vector<std::string> errors;
  std::set<unsigned>       seen_days;

  for (const auto& rule : rules) {
    const auto day = std::to_string(rule.day_of_week);
    if (rule.day_of_week >= kDaysPerWeek) {
      errors.push_back("day_of_week must be 0..6, got " + day);
      continue;
    }
    if (!seen_days.insert(rule.day_of_week).second) {
      errors.push_back("duplicate business hours for day " + day);
    }
    if (!rule.is_open) continue;

    if (rule.open_time < util::Minutes{0} || rule.close_time > kEndOfDay) {
      errors.push_back("business hours out of range for day " + day);
    }
    if (rule.open_time >= rule.close_time) {
      errors.push_back("open time must be before close time for day " + day);
    }
    for (const auto& brk : rule.breaks) {
      if (brk.start >= brk.end) {
        errors.push_back("break start must be before break end for day " + day);
      } else if (brk.start < rule.open_time || brk.end > rule.close_time) {
        errors.push_back("break " + FormatTimeOfDay(brk.start) + "-" + FormatTimeOfDay(brk.end) + " outside business hours for day " + day);
      }
    }
  }

  std::set<util::LocalDays> seen_dates;
  for (const auto& special : special_days) {
    const auto date = util::FormatDate(special.date);
    if (!seen_dates.insert(special.date).second) {
      errors.push_back("duplicate special hours for " + date);
    }
    if (special.is_closed) continue;

    if (special.open_time < util::Minutes{0} || special.close_time > kEndOfDay) {
      errors.push_back("special hours out of range for " + date);
    }
    if (special.open_time >= special.close_time) {
      errors.push_back("open time must be before close time for " + date);
    }
  }

  return errors;
}

std::vector<BusinessHoursRule> BusinessHoursCatalog::DefaultRules() {
  std::vector<BusinessHoursRule> rules;
  for (unsigned day = 0; day < kDaysPerWeek; ++day) {
    BusinessHoursRule rule;
    rule.day_of_week = day;
    rule.is_open     = day >= 1 && day <= 5;
    rule.open_time   = std::chrono::hours(9);
    rule.close_time  = std::chrono::hours(17);
    rules.push_back(rule);
  }
  return rules;
}

} // namespace booking::hours
