#pragma once

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/time_interval.hpp"
#include "internal/util/time.hpp"

namespace booking::hours {

// Minutes since business-local midnight. "24:00" is only valid as a closing time.
util::Minutes ParseTimeOfDay(std::string_view text, bool allow_end_of_day = false);
std::string   FormatTimeOfDay(util::Minutes time_of_day);

struct BreakPeriod {
  util::Minutes start{0};
  util::Minutes end{0};
};

struct BusinessHoursRule {
  unsigned                 day_of_week = 0; // 0 = Sunday
  util::Minutes            open_time{0};
  util::Minutes            close_time{0};
  bool                     is_open = false;
  std::vector<BreakPeriod> breaks;
};

// Date-specific override of the weekly rule (holiday closure, extended hours).
struct SpecialDay {
  util::LocalDays date{};
  bool            is_closed = true;
  util::Minutes   open_time{0};
  util::Minutes   close_time{0};
  std::string     reason;
};

/*
  Immutable business-hours table.

  A query takes one snapshot and uses it for its whole lifetime, so a
  concurrent ReplaceAll can never hand it a half-updated table.
*/
class HoursSnapshot {
 public:
  HoursSnapshot(const std::vector<BusinessHoursRule>& rules, const std::vector<SpecialDay>& special_days, util::Minutes utc_offset);

  std::optional<BusinessHoursRule> HoursFor(unsigned day_of_week) const;
  bool                             IsOpen(unsigned day_of_week) const;

  // Effective hours on a business-local date after special-day overrides;
  // nullopt when closed.
  std::optional<BusinessHoursRule> HoursOn(util::LocalDays date) const;

  // Open windows on a local date as absolute instants, breaks removed.
  std::vector<model::TimeInterval> OpenWindowsOn(util::LocalDays date) const;

  util::Minutes utc_offset() const {
    return utc_offset_;
  }

  std::vector<BusinessHoursRule> Rules() const;
  std::vector<SpecialDay>        SpecialDays() const;

 private:
  std::array<std::optional<BusinessHoursRule>, 7> weekly_;
  std::map<util::LocalDays, SpecialDay>           special_days_;
  util::Minutes                                   utc_offset_{0};
};

/*
  BusinessHoursCatalog

  Weekly open/close schedule shared read-only by every query in flight.
  Reconfiguration publishes a brand-new snapshot; the active one is never
  mutated in place.
*/
class BusinessHoursCatalog {
 public:
  BusinessHoursCatalog();
  explicit BusinessHoursCatalog(std::vector<BusinessHoursRule> rules, std::vector<SpecialDay> special_days = {},
                                util::Minutes utc_offset = util::Minutes{0});

  // Throws InvalidArgument when day_of_week is outside 0..6.
  std::optional<BusinessHoursRule> HoursFor(unsigned day_of_week) const;
  bool                             IsOpen(unsigned day_of_week) const;

  // Atomic swap of the whole table. Throws InvalidArgument (and keeps the
  // current table) when the new rules do not validate. An unset offset
  // keeps the current one.
  void ReplaceAll(std::vector<BusinessHoursRule> rules, std::vector<SpecialDay> special_days = {},
                  std::optional<util::Minutes> utc_offset = std::nullopt);

  std::shared_ptr<const HoursSnapshot> Snapshot() const;

  // Every problem with a rule set; empty when valid.
  static std::vector<std::string> Validate(const std::vector<BusinessHoursRule>& rules, const std::vector<SpecialDay>& special_days = {});

  // Monday to Friday, 09:00-17:00.
  static std::vector<BusinessHoursRule> DefaultRules();

 private:
  mutable std::shared_mutex            mutex_;
  std::shared_ptr<const HoursSnapshot> snapshot_;
};

} // namespace booking::hours
