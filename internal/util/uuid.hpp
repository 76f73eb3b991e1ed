#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace booking::util {

/*
  UUID helpers

  Booking ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewBookingId() {
  return ToString(GenerateUUID());
}

} // namespace booking::util
