#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/scheduling_policy.hpp"
#include "internal/store/repository_appointment_store.hpp"
#if BOOKING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BOOKING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace booking::factory {

using booking::runtime::config::BusinessHoursConfig;
using booking::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BOOKING_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    BOOKING_LOG_INFO("Using sqlite appointment repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BOOKING_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    BOOKING_LOG_INFO("Using postgres appointment repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BOOKING_LOG_INFO("Using in-memory appointment repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

std::vector<hours::BusinessHoursRule> BuildWeeklyRules(const BusinessHoursConfig& config) {
  if (config.weekly_size() == 0) {
    return hours::BusinessHoursCatalog::DefaultRules();
  }

  std::vector<hours::BusinessHoursRule> rules;
  rules.reserve(config.weekly_size());
  for (const auto& weekly : config.weekly()) {
    hours::BusinessHoursRule rule;
    rule.day_of_week = weekly.day_of_week();
    rule.is_open     = weekly.is_open();
    if (rule.is_open) {
      rule.open_time  = hours::ParseTimeOfDay(weekly.open());
      rule.close_time = hours::ParseTimeOfDay(weekly.close(), true);
      for (const auto& brk : weekly.breaks()) {
        rule.breaks.push_back(hours::BreakPeriod{hours::ParseTimeOfDay(brk.start()), hours::ParseTimeOfDay(brk.end(), true)});
      }
    }
    rules.push_back(std::move(rule));
  }
  return rules;
}

std::vector<hours::SpecialDay> BuildSpecialDays(const BusinessHoursConfig& config) {
  std::vector<hours::SpecialDay> days;
  days.reserve(config.special_days_size());
  for (const auto& special : config.special_days()) {
    hours::SpecialDay day;
    day.date      = util::ParseDate(special.date());
    day.is_closed = special.is_closed();
    day.reason    = special.reason();
    if (!day.is_closed) {
      day.open_time  = hours::ParseTimeOfDay(special.open());
      day.close_time = hours::ParseTimeOfDay(special.close(), true);
    }
    days.push_back(std::move(day));
  }
  return days;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  store::StoreOptions store_options;
  if (config.database().write_retry_attempts() > 0) {
    store_options.write_retry_attempts = config.database().write_retry_attempts();
  }
  app.store = std::make_shared<store::RepositoryAppointmentStore>(app.repository, store_options);

  for (const auto& resource : config.resources()) {
    app.store->RegisterResource(store::ResourceInfo{resource.id(), resource.display_name()});
  }

  // ------------------------------------------------------------------
  // Business hours
  // ------------------------------------------------------------------
  const auto& hours_config = config.business_hours();
  app.catalog = std::make_shared<hours::BusinessHoursCatalog>(BuildWeeklyRules(hours_config), BuildSpecialDays(hours_config),
                                                              util::Minutes(hours_config.utc_offset_minutes()));

  // ------------------------------------------------------------------
  // Scheduling engine
  // ------------------------------------------------------------------
  auto policy     = scheduling::SchedulingPolicy::FromConfig(config.scheduling());
  app.coordinator = std::make_shared<scheduling::AvailabilityCoordinator>(app.catalog, app.store, std::move(policy));

  BOOKING_LOG_INFO("Booking engine ready", {observability::IntField("resources", config.resources_size()),
                                            observability::IntField("weekly_rules", hours_config.weekly_size()),
                                            observability::IntField("special_days", hours_config.special_days_size())});
  return app;
}

} // namespace booking::factory
