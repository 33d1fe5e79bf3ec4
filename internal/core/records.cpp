#include "records.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

Table ToTable(const db::model::TableRecord& record) {
  Table table;
  table.set_id(record.id);
  table.set_restaurant_id(record.restaurant_id);
  table.set_number(record.number);
  table.set_min_capacity(record.min_capacity);
  table.set_max_capacity(record.max_capacity);
  table.set_combinable(record.combinable);
  table.set_active(record.active);
  table.set_priority(record.priority);
  table.set_section(record.section);
  for (const auto& id : record.adjacent_table_ids) table.add_adjacent_table_ids(id);
  return table;
}

db::model::TableRecord ToTableRecord(const Table& table) {
  db::model::TableRecord record;
  record.id            = table.id();
  record.restaurant_id = table.restaurant_id();
  record.number        = table.number();
  record.min_capacity  = table.min_capacity();
  record.max_capacity  = table.max_capacity();
  record.combinable    = table.combinable();
  record.active        = table.active();
  record.priority      = table.priority();
  record.section       = table.section();
  record.adjacent_table_ids.assign(table.adjacent_table_ids().begin(), table.adjacent_table_ids().end());
  return record;
}

std::vector<Table> ToTables(const std::vector<db::model::TableRecord>& records) {
  std::vector<Table> tables;
  tables.reserve(records.size());
  for (const auto& record : records) tables.push_back(ToTable(record));
  return tables;
}

TurnTimeRule ToTurnTimeRule(const db::model::TurnTimeRuleRecord& record) {
  TurnTimeRule rule;
  rule.set_id(record.id);
  rule.set_restaurant_id(record.restaurant_id);
  rule.set_name(record.name);
  rule.set_min_party_size(record.min_party_size);
  rule.set_max_party_size(record.max_party_size);
  rule.set_duration_minutes(record.duration_minutes);
  rule.set_priority(record.priority);
  rule.set_active(record.active);
  return rule;
}

db::model::TurnTimeRuleRecord ToTurnTimeRuleRecord(const TurnTimeRule& rule) {
  db::model::TurnTimeRuleRecord record;
  record.id               = rule.id();
  record.restaurant_id    = rule.restaurant_id();
  record.name             = rule.name();
  record.min_party_size   = rule.min_party_size();
  record.max_party_size   = rule.max_party_size();
  record.duration_minutes = rule.duration_minutes();
  record.priority         = rule.priority();
  record.active           = rule.active();
  return record;
}

Restaurant ToRestaurant(const db::model::RestaurantRecord& record) {
  Restaurant restaurant;
  auto       status = google::protobuf::util::JsonStringToMessage(record.definition_json, &restaurant);
  if (!status.ok()) {
    throw util::StorageError(db::ErrorCode::Corruption,
                             "restaurant " + record.id + " definition: " + std::string(status.message()));
  }
  restaurant.set_id(record.id);
  restaurant.set_name(record.name);
  return restaurant;
}

db::model::RestaurantRecord ToRestaurantRecord(const Restaurant& restaurant, uint64_t updated_at_ms) {
  db::model::RestaurantRecord record;
  record.id            = restaurant.id();
  record.name          = restaurant.name();
  record.updated_at_ms = updated_at_ms;

  auto status = google::protobuf::util::MessageToJsonString(restaurant, &record.definition_json);
  if (!status.ok()) {
    throw util::InvalidArgument("restaurant " + restaurant.id() + ": " + std::string(status.message()));
  }
  return record;
}

Booking ToBooking(const db::model::BookingRecord& record) {
  Booking booking;
  booking.set_id(record.id);
  booking.set_restaurant_id(record.restaurant_id);
  if (!record.table_ids.empty()) {
    booking.set_table_id(record.table_ids.front());
    for (size_t i = 1; i < record.table_ids.size(); ++i) booking.add_combined_table_ids(record.table_ids[i]);
  }
  booking.set_date(record.date);
  booking.set_time(util::FormatTimeOfDay(record.start_minute));
  booking.set_duration_minutes(record.duration_minutes);
  booking.set_party_size(record.party_size);
  booking.set_status(record.status);
  booking.set_source(record.source);
  booking.mutable_customer()->set_name(record.customer_name);
  booking.mutable_customer()->set_email(record.customer_email);
  booking.mutable_customer()->set_phone(record.customer_phone);
  booking.set_notes(record.notes);
  booking.set_pacing_overridden(record.pacing_overridden);
  booking.set_override_reason(record.override_reason);
  booking.set_created_by(record.created_by);
  booking.set_confirmation_code(record.confirmation_code);
  booking.set_created_at_ms(record.created_at_ms);
  booking.set_updated_at_ms(record.updated_at_ms);
  return booking;
}

} // namespace tablebook::core
