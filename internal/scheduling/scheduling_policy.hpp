#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace booking::runtime::config {
class SchedulingConfig;
}

namespace booking::scheduling {

/*
  Business policy knobs. Every value has an engine default and can be
  overridden under `scheduling:` in the runtime config.
*/
struct SchedulingPolicy {
  util::Minutes default_duration{60};
  util::Minutes default_buffer{15};
  util::Minutes min_duration{15};
  util::Minutes max_duration{480};

  util::Minutes min_lead_time{0};
  int           max_advance_days = 0; // 0 = unlimited

  util::Minutes slot_step{0}; // 0 = step equals the slot duration

  int default_max_results    = 50;
  int suggestion_within_days = 7;
  int max_suggestions        = 5;
  int max_days_to_check      = 30;

  std::optional<std::chrono::milliseconds> store_timeout;

  // Every inconsistency; empty when usable.
  std::vector<std::string> Validate() const;

  // Unset config fields keep the defaults above. Throws InvalidArgument when
  // the merged policy does not validate.
  static SchedulingPolicy FromConfig(const booking::runtime::config::SchedulingConfig& config);
};

} // namespace booking::scheduling
