#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace booking::util {

/*
  Central error types.

  Query operations throw InvalidArgument before touching the store and
  StoreUnavailable when a store read fails. Conflict is only ever raised by
  the booking write path.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  Conflict(const std::string& msg, std::vector<std::string> booking_ids)
      : std::runtime_error(msg), booking_ids_(std::move(booking_ids)) {
  }

  // Ids of the committed bookings that overlap the rejected interval.
  const std::vector<std::string>& booking_ids() const {
    return booking_ids_;
  }

 private:
  std::vector<std::string> booking_ids_;
};

} // namespace booking::util
