#pragma once

#include <cstdint>
#include <string>

namespace tablebook::db::model {

struct TurnTimeRuleRecord {
  std::string id;
  std::string restaurant_id;
  std::string name;
  uint32_t    min_party_size   = 1;
  uint32_t    max_party_size   = 0;
  uint32_t    duration_minutes = 0;
  int32_t     priority         = 0;
  bool        active           = true;
};

} // namespace tablebook::db::model
