#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tablebook::db::model {

// Tables are never hard-deleted; `active = false` is the soft delete.
struct TableRecord {
  std::string id;
  std::string restaurant_id;
  std::string number;
  uint32_t    min_capacity = 1;
  uint32_t    max_capacity = 0;
  bool        combinable   = false;
  bool        active       = true;
  int32_t     priority     = 0;
  std::string section;

  std::vector<std::string> adjacent_table_ids;
};

} // namespace tablebook::db::model
