#pragma once

#include <string>
#include <string_view>

namespace tablebook::lock {

inline constexpr std::string_view kDefaultKeyPrefix = "booking-lock:";

// Slot key for (restaurant, date, time). Every component is length
// prefixed, so distinct triples never serialize to the same key even
// when the components contain the separator.
std::string SlotLockKey(std::string_view prefix, std::string_view restaurant_id, std::string_view date,
                        std::string_view time);

// Table key for (restaurant, table, date); taken alongside the slot key
// when a caller books a specific table.
std::string TableLockKey(std::string_view prefix, std::string_view restaurant_id, std::string_view table_id,
                         std::string_view date);

} // namespace tablebook::lock
