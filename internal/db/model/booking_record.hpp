#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace booking::db::model {

/*
  Row of the booking table. Instants are unix milliseconds (UTC),
  status is the lowercase BookingStatus text.
*/
struct BookingRecord {
  std::string                id;
  std::optional<std::string> resource_id;
  int64_t                    start_ms = 0;
  int64_t                    end_ms   = 0;
  std::string                status;
  std::string                payload; // opaque caller data

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace booking::db::model
