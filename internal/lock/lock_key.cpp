#include "lock_key.hpp"

#include <initializer_list>

namespace tablebook::lock {
namespace {

std::string Encode(std::string_view prefix, std::string_view kind, std::initializer_list<std::string_view> parts) {
  std::string out(prefix);
  out.append(kind);
  for (auto part : parts) {
    out.push_back(':');
    out.append(std::to_string(part.size()));
    out.push_back('#');
    out.append(part);
  }
  return out;
}

} // namespace

std::string SlotLockKey(std::string_view prefix, std::string_view restaurant_id, std::string_view date,
                        std::string_view time) {
  return Encode(prefix, "slot", {restaurant_id, date, time});
}

std::string TableLockKey(std::string_view prefix, std::string_view restaurant_id, std::string_view table_id,
                         std::string_view date) {
  return Encode(prefix, "table", {restaurant_id, table_id, date});
}

} // namespace tablebook::lock
