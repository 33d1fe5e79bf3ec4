#include "internal/core/slot_grid_generator.hpp"

#include <cassert>
#include <iostream>

#include "booking_fixtures.hpp"

namespace {

using tablebook::core::SlotGridGenerator;
using tablebook::testing::Dinner;
using tablebook::testing::kDate;
using tablebook::testing::MakeRestaurant;

tablebook::util::Date Day(const char* text) {
  auto date = tablebook::util::ParseDate(text);
  assert(date);
  return *date;
}

void TestDinnerGridIncludesEnd() {
  SlotGridGenerator generator;
  auto              grid = generator.Generate(MakeRestaurant(), Day(kDate));

  assert(grid.open);
  assert(grid.slots.size() == 9);
  assert(grid.slots.front().time == "18:00");
  assert(grid.slots.back().time == "22:00");
  assert(grid.slots[1].minute == 18 * 60 + 30);
  assert(grid.slots.front().period == "dinner");
  assert(grid.slots.front().interval_minutes == 30);
}

void TestLastSeatingOffsetTrimsTail() {
  auto restaurant = MakeRestaurant();
  restaurant.mutable_settings()->set_last_seating_offset_minutes(60);

  auto grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate));
  assert(grid.slots.size() == 7);
  assert(grid.slots.back().time == "21:00");
}

void TestClosedDayYieldsNoSlots() {
  auto restaurant = MakeRestaurant();
  restaurant.mutable_schedule()->mutable_friday()->set_open(false);

  auto grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate));
  assert(!grid.open);
  assert(grid.slots.empty());

  // open flag without any period is closed too
  restaurant.mutable_schedule()->mutable_friday()->set_open(true);
  restaurant.mutable_schedule()->mutable_friday()->clear_periods();
  assert(!SlotGridGenerator{}.Generate(restaurant, Day(kDate)).open);
}

void TestPeriodsAreNotBridged() {
  auto restaurant = MakeRestaurant();
  auto day        = Dinner("17:30", "19:00");
  auto* lunch     = day.add_periods();
  lunch->set_name("lunch");
  lunch->set_start_time("12:00");
  lunch->set_end_time("13:00");
  *restaurant.mutable_schedule()->mutable_friday() = day;

  auto grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate));
  assert(grid.slots.size() == 7);
  assert(grid.slots[0].time == "12:00");
  assert(grid.slots[2].time == "13:00");
  assert(grid.slots[2].period == "lunch");
  assert(grid.slots[3].time == "17:30");
  assert(grid.slots[3].period == "dinner");
  for (const auto& slot : grid.slots) {
    assert(slot.minute <= 13 * 60 || slot.minute >= 17 * 60 + 30);
  }
}

void TestIntervalPrecedence() {
  auto restaurant = MakeRestaurant();
  restaurant.mutable_settings()->set_slot_interval_minutes(0);

  auto grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate), 60);
  assert(grid.slots.size() == 5);
  assert(grid.slots[1].time == "19:00");

  restaurant.mutable_settings()->set_slot_interval_minutes(15);
  grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate), 60);
  assert(grid.slots.size() == 17);

  restaurant.mutable_schedule()->mutable_friday()->mutable_periods(0)->set_slot_interval_minutes(120);
  grid = SlotGridGenerator{}.Generate(restaurant, Day(kDate), 60);
  assert(grid.slots.size() == 3);
  assert(grid.slots.back().time == "22:00");
  assert(grid.slots.back().interval_minutes == 120);

  tablebook::v1::ServicePeriod bare;
  tablebook::v1::Restaurant    empty;
  assert(SlotGridGenerator::IntervalFor(empty, bare, 0) == SlotGridGenerator::kDefaultIntervalMinutes);
}

void TestPeriodAt() {
  auto restaurant = MakeRestaurant();
  assert(SlotGridGenerator::PeriodAt(restaurant, Day(kDate), 18 * 60) != nullptr);
  assert(SlotGridGenerator::PeriodAt(restaurant, Day(kDate), 22 * 60) != nullptr);
  assert(SlotGridGenerator::PeriodAt(restaurant, Day(kDate), 17 * 60 + 59) == nullptr);
  assert(SlotGridGenerator::PeriodAt(restaurant, Day(kDate), 22 * 60 + 1) == nullptr);
}

void TestWeekdayMapping() {
  auto restaurant = MakeRestaurant();
  restaurant.mutable_schedule()->mutable_sunday()->set_open(false);

  // 2030-06-16 is a Sunday
  assert(!SlotGridGenerator{}.Generate(restaurant, Day("2030-06-16")).open);
  assert(SlotGridGenerator{}.Generate(restaurant, Day("2030-06-17")).open);
}

} // namespace

int main() {
  TestDinnerGridIncludesEnd();
  TestLastSeatingOffsetTrimsTail();
  TestClosedDayYieldsNoSlots();
  TestPeriodsAreNotBridged();
  TestIntervalPrecedence();
  TestPeriodAt();
  TestWeekdayMapping();

  std::cout << "tablebook_unit_slot_grid_generator: pass\n";
  return 0;
}
