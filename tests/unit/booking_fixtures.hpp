#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/availability_reporter.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/core/catalog_seeder.hpp"
#include "internal/core/turn_time_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::testing {

// Friday; far enough from FixedNow() that no advance rule triggers.
inline constexpr const char* kDate = "2030-06-14";

inline util::TimePoint FixedNow() {
  return util::ToInstant(*util::ParseDate("2030-06-01"), 12 * 60, 0);
}

inline tablebook::v1::DaySchedule Dinner(const std::string& start = "18:00", const std::string& end = "22:00") {
  tablebook::v1::DaySchedule day;
  day.set_open(true);
  auto* period = day.add_periods();
  period->set_name("dinner");
  period->set_start_time(start);
  period->set_end_time(end);
  return day;
}

// Open every day for dinner 18:00-22:00, 30 minute slots, UTC wall clock.
inline tablebook::v1::Restaurant MakeRestaurant(const std::string& id = "bistro") {
  tablebook::v1::Restaurant restaurant;
  restaurant.set_id(id);
  restaurant.set_name("Bistro " + id);

  auto* schedule                = restaurant.mutable_schedule();
  *schedule->mutable_monday()    = Dinner();
  *schedule->mutable_tuesday()   = Dinner();
  *schedule->mutable_wednesday() = Dinner();
  *schedule->mutable_thursday()  = Dinner();
  *schedule->mutable_friday()    = Dinner();
  *schedule->mutable_saturday()  = Dinner();
  *schedule->mutable_sunday()    = Dinner();

  restaurant.mutable_settings()->set_slot_interval_minutes(30);
  return restaurant;
}

inline tablebook::v1::Table MakeTable(const std::string& id, uint32_t min_capacity, uint32_t max_capacity, int32_t priority = 0) {
  tablebook::v1::Table table;
  table.set_id(id);
  table.set_number(id);
  table.set_min_capacity(min_capacity);
  table.set_max_capacity(max_capacity);
  table.set_active(true);
  table.set_priority(priority);
  return table;
}

inline tablebook::v1::TurnTimeRule MakeRule(const std::string& id, uint32_t min_party, uint32_t max_party, uint32_t minutes,
                                            int32_t priority = 0) {
  tablebook::v1::TurnTimeRule rule;
  rule.set_id(id);
  rule.set_name(id);
  rule.set_min_party_size(min_party);
  rule.set_max_party_size(max_party);
  rule.set_duration_minutes(minutes);
  rule.set_priority(priority);
  rule.set_active(true);
  return rule;
}

inline void Seed(db::Repository& repository, const tablebook::v1::Restaurant& restaurant,
                 const std::vector<tablebook::v1::Table>& tables, const std::vector<tablebook::v1::TurnTimeRule>& rules = {}) {
  tablebook::v1::RestaurantCatalog catalog;
  auto*                            entry = catalog.add_restaurants();
  *entry->mutable_restaurant()           = restaurant;
  for (const auto& table : tables) *entry->add_tables() = table;
  for (const auto& rule : rules) *entry->add_turn_time_rules() = rule;
  core::CatalogSeeder::Seed(repository, catalog, 0);
}

// Writes a confirmed booking straight to storage, bypassing the lock.
inline db::model::BookingRecord Book(db::Repository& repository, const std::string& id, const std::vector<std::string>& tables,
                                     const std::string& time, uint32_t party, uint32_t duration = 90,
                                     const std::string& date = kDate, const std::string& restaurant_id = "bistro") {
  db::model::BookingRecord record;
  record.id                = id;
  record.restaurant_id     = restaurant_id;
  record.date              = date;
  record.start_minute      = *util::ParseTimeOfDay(time);
  record.duration_minutes  = duration;
  record.party_size        = party;
  record.status            = tablebook::v1::BOOKING_STATUS_CONFIRMED;
  record.source            = tablebook::v1::BOOKING_SOURCE_STAFF;
  record.table_ids         = tables;
  record.confirmation_code = "CONF" + id;
  record.version           = 1;

  auto tx = repository.Begin();
  util::ThrowIfDbError(repository.InsertBooking(*tx, record), "seed booking");
  tx->Commit();
  return record;
}

inline lock::LockOptions FastLocks() {
  lock::LockOptions options;
  options.ttl             = std::chrono::seconds(5);
  options.max_wait        = std::chrono::seconds(5);
  options.initial_backoff = std::chrono::milliseconds(1);
  options.max_backoff     = std::chrono::milliseconds(10);
  return options;
}

// Booking engine over memory storage with the clock pinned to FixedNow().
struct Engine {
  std::shared_ptr<db::memory::MemoryRepository> repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<lock::LockCoordinator>        locks;
  std::shared_ptr<core::TurnTimeResolver>       turn_times = std::make_shared<core::TurnTimeResolver>(repository);
  std::shared_ptr<core::AvailabilityReporter>   reporter;
  std::shared_ptr<core::BookingManager>         bookings;

  explicit Engine(lock::LockOptions options = FastLocks())
      : locks(std::make_shared<lock::LockCoordinator>(std::move(options))),
        reporter(std::make_shared<core::AvailabilityReporter>(repository, turn_times, core::ReporterOptions{}, FixedNow)),
        bookings(std::make_shared<core::BookingManager>(repository, locks, turn_times, core::BookingOptions{}, FixedNow)) {
  }
};

inline tablebook::v1::CreateBookingRequest CreateRequest(const std::string& time, uint32_t party, uint32_t duration = 0,
                                                         const std::string& date = kDate) {
  tablebook::v1::CreateBookingRequest request;
  request.set_restaurant_id("bistro");
  request.set_date(date);
  request.set_time(time);
  request.set_party_size(party);
  request.set_duration_minutes(duration);
  request.mutable_customer()->set_name("Ada Guest");
  request.mutable_customer()->set_phone("+1 555 0100");
  request.set_created_by("host");
  return request;
}

} // namespace tablebook::testing
