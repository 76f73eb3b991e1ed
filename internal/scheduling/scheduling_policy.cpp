#include "scheduling_policy.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace booking::scheduling {

std::vector<std::string> SchedulingPolicy::Validate() const {
  std::vector<std::string> errors;
  if (default_duration <= util::Minutes{0}) errors.push_back("default_duration_minutes must be positive");
  if (min_duration <= util::Minutes{0}) errors.push_back("min_duration_minutes must be positive");
  if (min_duration > max_duration) errors.push_back("min_duration_minutes must not exceed max_duration_minutes");
  if (default_duration < min_duration || default_duration > max_duration) {
    errors.push_back("default_duration_minutes must lie within [min_duration_minutes, max_duration_minutes]");
  }
  if (default_buffer < util::Minutes{0}) errors.push_back("default_buffer_minutes must not be negative");
  if (default_max_results <= 0) errors.push_back("default_max_results must be positive");
  if (max_suggestions <= 0) errors.push_back("max_suggestions must be positive");
  if (suggestion_within_days < 0) errors.push_back("suggestion_within_days must not be negative");
  if (max_days_to_check < 0) errors.push_back("max_days_to_check must not be negative");
  return errors;
}

SchedulingPolicy SchedulingPolicy::FromConfig(const booking::runtime::config::SchedulingConfig& config) {
  SchedulingPolicy policy;

  if (config.has_default_duration_minutes()) policy.default_duration = util::Minutes(config.default_duration_minutes());
  if (config.has_default_buffer_minutes()) policy.default_buffer = util::Minutes(config.default_buffer_minutes());
  if (config.has_min_duration_minutes()) policy.min_duration = util::Minutes(config.min_duration_minutes());
  if (config.has_max_duration_minutes()) policy.max_duration = util::Minutes(config.max_duration_minutes());
  if (config.has_min_lead_time_minutes()) policy.min_lead_time = util::Minutes(config.min_lead_time_minutes());
  if (config.has_max_advance_days()) policy.max_advance_days = static_cast<int>(config.max_advance_days());
  if (config.has_slot_step_minutes()) policy.slot_step = util::Minutes(config.slot_step_minutes());
  if (config.has_default_max_results()) policy.default_max_results = static_cast<int>(config.default_max_results());
  if (config.has_suggestion_within_days()) policy.suggestion_within_days = static_cast<int>(config.suggestion_within_days());
  if (config.has_max_suggestions()) policy.max_suggestions = static_cast<int>(config.max_suggestions());
  if (config.has_max_days_to_check()) policy.max_days_to_check = static_cast<int>(config.max_days_to_check());
  if (config.has_store_timeout_ms() && config.store_timeout_ms() > 0) {
    policy.store_timeout = std::chrono::milliseconds(config.store_timeout_ms());
  }

  const auto errors = policy.Validate();
  if (!errors.empty()) {
    throw util::InvalidArgument("invalid scheduling policy: " + errors.front());
  }
  return policy;
}

} // namespace booking::scheduling
