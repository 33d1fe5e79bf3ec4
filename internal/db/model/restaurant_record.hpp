#pragma once

#include <cstdint>
#include <string>

namespace tablebook::db::model {

/*
  Persistent restaurant row.

  Schedule, pacing limits and booking settings are stored together as
  the JSON form of tablebook.core.v1.Restaurant.
*/
struct RestaurantRecord {
  std::string id;
  std::string name;
  std::string definition_json;
  uint64_t    updated_at_ms = 0;
};

} // namespace tablebook::db::model
