#include "catalog_seeder.hpp"

#include <set>

#include "internal/core/records.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

namespace {

void ValidatePeriods(const Restaurant& restaurant, const DaySchedule& day, const char* weekday) {
  for (const auto& period : day.periods()) {
    const auto start = util::ParseTimeOfDay(period.start_time());
    const auto end   = util::ParseTimeOfDay(period.end_time());
    if (!start || !end || *end < *start) {
      throw util::InvalidArgument("restaurant " + restaurant.id() + ": bad service period '" + period.name() + "' on " + weekday);
    }
  }
}

} // namespace

void CatalogSeeder::Validate(const RestaurantCatalog& catalog) {
  std::set<std::string> restaurant_ids;
  for (const auto& entry : catalog.restaurants()) {
    const auto& restaurant = entry.restaurant();
    if (restaurant.id().empty()) throw util::InvalidArgument("catalog restaurant without id");
    if (!restaurant_ids.insert(restaurant.id()).second) {
      throw util::InvalidArgument("duplicate restaurant id in catalog: " + restaurant.id());
    }

    const auto& schedule = restaurant.schedule();
    ValidatePeriods(restaurant, schedule.monday(), "monday");
    ValidatePeriods(restaurant, schedule.tuesday(), "tuesday");
    ValidatePeriods(restaurant, schedule.wednesday(), "wednesday");
    ValidatePeriods(restaurant, schedule.thursday(), "thursday");
    ValidatePeriods(restaurant, schedule.friday(), "friday");
    ValidatePeriods(restaurant, schedule.saturday(), "saturday");
    ValidatePeriods(restaurant, schedule.sunday(), "sunday");

    std::set<std::string> table_ids;
    for (const auto& table : entry.tables()) {
      if (table.id().empty()) throw util::InvalidArgument("restaurant " + restaurant.id() + ": table without id");
      if (!table_ids.insert(table.id()).second) {
        throw util::InvalidArgument("restaurant " + restaurant.id() + ": duplicate table id " + table.id());
      }
      if (table.max_capacity() == 0 || table.min_capacity() > table.max_capacity()) {
        throw util::InvalidArgument("table " + table.id() + ": capacity range is empty");
      }
    }

    for (const auto& rule : entry.turn_time_rules()) {
      if (rule.id().empty()) throw util::InvalidArgument("restaurant " + restaurant.id() + ": turn-time rule without id");
      if (rule.min_party_size() > rule.max_party_size()) {
        throw util::InvalidArgument("turn-time rule " + rule.id() + ": party range is empty");
      }
    }
  }
}

std::size_t CatalogSeeder::Seed(db::Repository& repository, const RestaurantCatalog& catalog, uint64_t now_ms) {
  Validate(catalog);

  for (const auto& entry : catalog.restaurants()) {
    const auto& restaurant = entry.restaurant();
    auto        tx         = repository.Begin();

    util::ThrowIfDbError(repository.UpsertRestaurant(*tx, ToRestaurantRecord(restaurant, now_ms)), "upsert restaurant " + restaurant.id());

    for (auto table : entry.tables()) {
      if (table.restaurant_id().empty()) table.set_restaurant_id(restaurant.id());
      util::ThrowIfDbError(repository.UpsertTable(*tx, ToTableRecord(table)), "upsert table " + table.id());
    }
    for (auto rule : entry.turn_time_rules()) {
      if (rule.restaurant_id().empty()) rule.set_restaurant_id(restaurant.id());
      util::ThrowIfDbError(repository.UpsertTurnTimeRule(*tx, ToTurnTimeRuleRecord(rule)), "upsert turn-time rule " + rule.id());
    }
    tx->Commit();

    TABLEBOOK_LOG_INFO("restaurant seeded", {observability::StringField("restaurant_id", restaurant.id()),
                                             observability::IntField("tables", entry.tables_size()),
                                             observability::IntField("turn_time_rules", entry.turn_time_rules_size())});
  }
  return static_cast<std::size_t>(catalog.restaurants_size());
}

} // namespace tablebook::core
