#pragma once

#include <exception>
#include <pqxx/pqxx>

#include "internal/db/api/result.hpp"

namespace booking::db::postgres {

// Maps libpqxx exception types onto the portable codes.
inline db::ErrorCode Classify(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return db::ErrorCode::SerializationFailure;
  }
  if (dynamic_cast<const pqxx::query_cancelled*>(&e)) {
    return db::ErrorCode::Timeout;
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return db::ErrorCode::AlreadyExists;
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return db::ErrorCode::ConstraintViolation;
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return db::ErrorCode::IOError;
  }
  return db::ErrorCode::InternalError;
}

} // namespace booking::db::postgres
