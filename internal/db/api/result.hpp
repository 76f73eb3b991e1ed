#pragma once

#include <stdexcept>
#include <string>

namespace booking::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  Timeout,
  IOError,
  Corruption,

  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by reads and by Transaction::Commit(). Writes report through Result.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

  // The whole transaction may be replayed.
  bool Retryable() const {
    return code_ == ErrorCode::SerializationFailure || code_ == ErrorCode::Busy;
  }

 private:
  ErrorCode code_;
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace booking::db
