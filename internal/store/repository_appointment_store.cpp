#include "repository_appointment_store.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace booking::store {

namespace {

void Check(const db::Result& result) {
  if (!result) {
    throw db::DbError(result.code, result.message);
  }
}

model::ExistingBooking ToExisting(const db::model::BookingRecord& record) {
  model::ExistingBooking booking;
  booking.id          = record.id;
  booking.interval    = model::TimeInterval{util::FromUnixMillis(record.start_ms), util::FromUnixMillis(record.end_ms)};
  booking.resource_id = record.resource_id;
  try {
    booking.status = model::ParseBookingStatus(record.status);
  } catch (const util::InvalidArgument& e) {
    throw db::DbError(db::ErrorCode::Corruption, "booking " + record.id + ": " + e.what());
  }
  return booking;
}

db::BookingQuery QueryFor(const model::TimeInterval& range, const std::optional<std::vector<std::string>>& resource_ids) {
  db::BookingQuery query;
  query.start_ms     = util::ToUnixMillis(range.start);
  query.end_ms       = util::ToUnixMillis(range.end);
  query.resource_ids = resource_ids;
  return query;
}

void CheckInterval(const model::TimeInterval& interval) {
  if (!(interval.start < interval.end)) {
    throw util::InvalidArgument("booking interval must satisfy start < end: " + model::ToString(interval));
  }
}

} // namespace

RepositoryAppointmentStore::RepositoryAppointmentStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (options_.write_retry_attempts == 0) {
    options_.write_retry_attempts = 1;
  }
}

template <typename Fn>
auto RepositoryAppointmentStore::RunRead(std::string_view operation, std::optional<util::TimePoint> deadline, Fn&& body) {
  try {
    db::TxOptions tx_options;
    tx_options.deadline = deadline;

    auto tx     = repository_->Begin(tx_options);
    auto result = body(*tx);
    tx->Commit();
    return result;
  } catch (const db::DbError& e) {
    BOOKING_LOG_ERROR("Store read failed", {observability::StringField("operation", operation), observability::StringField("code", db::ToString(e.code())),
                                            observability::StringField("error", e.what())});
    throw util::StoreUnavailable(std::string(operation) + ": " + e.what());
  }
}

template <typename Fn>
auto RepositoryAppointmentStore::RunWrite(std::string_view operation, Fn&& body) {
  observability::SpanScope span(std::string("store.") + std::string(operation));

  for (unsigned attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin(db::TxOptions{});
      auto result = body(*tx);
      tx->Commit();
      return result;
    } catch (const db::DbError& e) {
      if (!e.Retryable() || attempt >= options_.write_retry_attempts) {
        span.RecordException(e.what());
        BOOKING_LOG_ERROR("Store write failed",
                          {observability::StringField("operation", operation), observability::StringField("code", db::ToString(e.code())),
                           observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
        throw util::StoreUnavailable(std::string(operation) + ": " + e.what());
      }
      BOOKING_LOG_WARN("Store write retry", {observability::StringField("operation", operation), observability::StringField("code", db::ToString(e.code())),
                                             observability::IntField("attempt", attempt)});
    }
  }
}

void RepositoryAppointmentStore::CheckNoOverlap(db::Transaction& tx, std::string_view operation, const model::TimeInterval& interval,
                                                const std::optional<std::string>& resource_id,
                                                const std::optional<std::string>& exclude_booking_id) {
  std::optional<std::vector<std::string>> resource_filter;
  if (resource_id) {
    resource_filter = std::vector<std::string>{*resource_id};
  }

  std::vector<model::ExistingBooking> existing;
  for (const auto& record : repository_->ListBookings(tx, QueryFor(interval, resource_filter))) {
    existing.push_back(ToExisting(record));
  }

  const auto report = model::FindOverlaps(interval, existing, resource_id, exclude_booking_id);
  if (report.empty()) {
    return;
  }

  auto ids = report.BookingIds();
  observability::Metrics::Instance().RecordWriteConflict(operation);
  BOOKING_LOG_WARN("Booking write rejected by overlap check",
                   {observability::StringField("operation", operation), observability::StringField("interval", model::ToString(interval)),
                    observability::StringField("resource_id", resource_id.value_or("")),
                    observability::IntField("conflicts", static_cast<int64_t>(ids.size()))});
  throw util::Conflict("time no longer available: " + model::ToString(interval) + " overlaps " + std::to_string(ids.size()) + " booking(s)",
                       std::move(ids));
}

void RepositoryAppointmentStore::CheckResourceKnown(db::Transaction& tx, const std::string& resource_id) {
  const auto resources = repository_->ListResources(tx);
  const bool known =
      std::any_of(resources.begin(), resources.end(), [&](const db::model::ResourceRecord& r) { return r.id == resource_id; });
  if (!known) {
    throw util::InvalidArgument("unknown resource '" + resource_id + "'");
  }
}

std::vector<model::ExistingBooking> RepositoryAppointmentStore::ListBookings(const model::TimeInterval&                     range,
                                                                             const std::optional<std::vector<std::string>>& resource_ids,
                                                                             std::optional<util::TimePoint>                 deadline) {
  CheckInterval(range);
  return RunRead("list_bookings", deadline, [&](db::Transaction& tx) {
    std::vector<model::ExistingBooking> out;
    for (const auto& record : repository_->ListBookings(tx, QueryFor(range, resource_ids))) {
      out.push_back(ToExisting(record));
    }
    return out;
  });
}

std::vector<ResourceInfo> RepositoryAppointmentStore::ListResources(std::optional<util::TimePoint> deadline) {
  return RunRead("list_resources", deadline, [&](db::Transaction& tx) {
    std::vector<ResourceInfo> out;
    for (const auto& record : repository_->ListResources(tx)) {
      out.push_back(ResourceInfo{record.id, record.display_name});
    }
    return out;
  });
}

std::optional<model::ExistingBooking> RepositoryAppointmentStore::GetBooking(const std::string& booking_id) {
  return RunRead("get_booking", std::nullopt, [&](db::Transaction& tx) -> std::optional<model::ExistingBooking> {
    auto record = repository_->GetBooking(tx, booking_id);
    if (!record) return std::nullopt;
    return ToExisting(*record);
  });
}

std::string RepositoryAppointmentStore::CreateBooking(const model::TimeInterval& interval, const std::optional<std::string>& resource_id,
                                                      const std::string& payload) {
  CheckInterval(interval);

  const auto id = RunWrite("create_booking", [&](db::Transaction& tx) {
    Check(repository_->LockResource(tx, resource_id));
    if (resource_id) {
      CheckResourceKnown(tx, *resource_id);
    }
    CheckNoOverlap(tx, "create_booking", interval, resource_id, std::nullopt);

    const auto now = util::ToUnixMillis(util::Now());

    db::model::BookingRecord record;
    record.id            = util::NewBookingId();
    record.resource_id   = resource_id;
    record.start_ms      = util::ToUnixMillis(interval.start);
    record.end_ms        = util::ToUnixMillis(interval.end);
    record.status        = std::string(model::ToString(model::BookingStatus::kScheduled));
    record.payload       = payload;
    record.created_at_ms = now;
    record.updated_at_ms = now;
    Check(repository_->InsertBooking(tx, record));
    return record.id;
  });

  BOOKING_LOG_INFO("Booking created", {observability::StringField("booking_id", id), observability::StringField("resource_id", resource_id.value_or("")),
                                       observability::TimeField("start", interval.start), observability::TimeField("end", interval.end)});
  return id;
}

void RepositoryAppointmentStore::UpdateBookingTime(const std::string& booking_id, const model::TimeInterval& new_interval) {
  CheckInterval(new_interval);

  RunWrite("update_booking_time", [&](db::Transaction& tx) {
    // row lock first, so a concurrent cancel cannot be overwritten below
    auto record = repository_->LockBooking(tx, booking_id);
    if (!record) {
      throw util::NotFound("booking " + booking_id + " not found");
    }
    if (record->status == model::ToString(model::BookingStatus::kCancelled)) {
      throw util::InvalidArgument("booking " + booking_id + " is cancelled and cannot be rescheduled");
    }

    Check(repository_->LockResource(tx, record->resource_id));
    CheckNoOverlap(tx, "update_booking_time", new_interval, record->resource_id, booking_id);

    record->start_ms      = util::ToUnixMillis(new_interval.start);
    record->end_ms        = util::ToUnixMillis(new_interval.end);
    record->updated_at_ms = util::ToUnixMillis(util::Now());
    Check(repository_->UpdateBooking(tx, *record));
    return true;
  });

  BOOKING_LOG_INFO("Booking rescheduled", {observability::StringField("booking_id", booking_id), observability::TimeField("start", new_interval.start),
                                           observability::TimeField("end", new_interval.end)});
}

void RepositoryAppointmentStore::CancelBooking(const std::string& booking_id) {
  const bool changed = RunWrite("cancel_booking", [&](db::Transaction& tx) {
    auto record = repository_->LockBooking(tx, booking_id);
    if (!record) {
      throw util::NotFound("booking " + booking_id + " not found");
    }
    const auto cancelled = std::string(model::ToString(model::BookingStatus::kCancelled));
    if (record->status == cancelled) {
      return false;
    }
    record->status        = cancelled;
    record->updated_at_ms = util::ToUnixMillis(util::Now());
    Check(repository_->UpdateBooking(tx, *record));
    return true;
  });

  if (changed) {
    BOOKING_LOG_INFO("Booking cancelled", {observability::StringField("booking_id", booking_id)});
  }
}

void RepositoryAppointmentStore::RegisterResource(const ResourceInfo& resource) {
  if (resource.id.empty()) {
    throw util::InvalidArgument("resource id must not be empty");
  }

  RunWrite("register_resource", [&](db::Transaction& tx) {
    Check(repository_->UpsertResource(tx, db::model::ResourceRecord{resource.id, resource.display_name}));
    return true;
  });
}

} // namespace booking::store
