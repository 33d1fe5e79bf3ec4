#pragma once

#include <vector>

#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/restaurant_record.hpp"
#include "internal/db/model/table_record.hpp"
#include "internal/db/model/turn_time_rule_record.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

// Conversions between persistent rows and the proto domain objects.

tablebook::v1::Table        ToTable(const db::model::TableRecord& record);
db::model::TableRecord      ToTableRecord(const tablebook::v1::Table& table);
std::vector<tablebook::v1::Table> ToTables(const std::vector<db::model::TableRecord>& records);

tablebook::v1::TurnTimeRule   ToTurnTimeRule(const db::model::TurnTimeRuleRecord& record);
db::model::TurnTimeRuleRecord ToTurnTimeRuleRecord(const tablebook::v1::TurnTimeRule& rule);

// Throws StorageError(Corruption) when the stored definition does not parse.
tablebook::v1::Restaurant   ToRestaurant(const db::model::RestaurantRecord& record);
db::model::RestaurantRecord ToRestaurantRecord(const tablebook::v1::Restaurant& restaurant, uint64_t updated_at_ms);

tablebook::v1::Booking ToBooking(const db::model::BookingRecord& record);

} // namespace tablebook::core
