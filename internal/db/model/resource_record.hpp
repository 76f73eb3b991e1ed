#pragma once

#include <string>

namespace booking::db::model {

struct ResourceRecord {
  std::string id;
  std::string display_name;
};

} // namespace booking::db::model
