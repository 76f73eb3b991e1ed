#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/hours/business_hours_catalog.hpp"
#include "internal/scheduling/availability_coordinator.hpp"
#include "internal/store/appointment_store.hpp"

namespace booking::factory {

/*
  Application

  Owns every long-lived component of the engine.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<hours::BusinessHoursCatalog>        catalog;
  std::shared_ptr<store::AppointmentStore>            store;
  std::shared_ptr<scheduling::AvailabilityCoordinator> coordinator;
};

/*
  Build

  Constructs the engine from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const booking::runtime::config::RuntimeConfig& config);

// Weekly rules from config, Monday to Friday 09:00-17:00 when none are
// configured. Throws InvalidArgument on malformed times or dates.
std::vector<hours::BusinessHoursRule> BuildWeeklyRules(const booking::runtime::config::BusinessHoursConfig& config);
std::vector<hours::SpecialDay>        BuildSpecialDays(const booking::runtime::config::BusinessHoursConfig& config);

} // namespace booking::factory
