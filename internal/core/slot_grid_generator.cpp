#include "slot_grid_generator.hpp"

#include <algorithm>

namespace tablebook::core {

using namespace tablebook::v1;

const DaySchedule& SlotGridGenerator::DayFor(const OperatingSchedule& schedule, const util::Date& date) {
  switch (util::WeekdayIndex(date)) {
    case 0: return schedule.monday();
    case 1: return schedule.tuesday();
    case 2: return schedule.wednesday();
    case 3: return schedule.thursday();
    case 4: return schedule.friday();
    case 5: return schedule.saturday();
    default: return schedule.sunday();
  }
}

const ServicePeriod* SlotGridGenerator::PeriodAt(const Restaurant& restaurant, const util::Date& date, int minute) {
  const auto& day = DayFor(restaurant.schedule(), date);
  if (!day.open()) return nullptr;

  for (const auto& period : day.periods()) {
    auto start = util::ParseTimeOfDay(period.start_time());
    auto end   = util::ParseTimeOfDay(period.end_time());
    if (!start || !end) continue;
    if (minute >= *start && minute <= *end) return &period;
  }
  return nullptr;
}

uint32_t SlotGridGenerator::IntervalFor(const Restaurant& restaurant, const ServicePeriod& period, uint32_t fallback) {
  if (period.slot_interval_minutes() > 0) return period.slot_interval_minutes();
  if (restaurant.settings().slot_interval_minutes() > 0) return restaurant.settings().slot_interval_minutes();
  return fallback > 0 ? fallback : kDefaultIntervalMinutes;
}

SlotGrid SlotGridGenerator::Generate(const Restaurant& restaurant, const util::Date& date, uint32_t interval_minutes) const {
  SlotGrid grid;

  const auto& day = DayFor(restaurant.schedule(), date);
  if (!day.open() || day.periods_size() == 0) return grid;
  grid.open = true;

  const auto& settings = restaurant.settings();
  const int   offset   = static_cast<int>(settings.last_seating_offset_minutes());

  for (const auto& period : day.periods()) {
    auto start = util::ParseTimeOfDay(period.start_time());
    auto end   = util::ParseTimeOfDay(period.end_time());
    if (!start || !end) continue;

    const uint32_t step = IntervalFor(restaurant, period, interval_minutes);

    const int last = *end - offset;
    for (int t = *start; t <= last; t += static_cast<int>(step)) {
      grid.slots.push_back(Slot{t, util::FormatTimeOfDay(t), period.name(), step});
    }
  }

  // overlapping periods: keep the first period's slot
  std::stable_sort(grid.slots.begin(), grid.slots.end(), [](const Slot& a, const Slot& b) { return a.minute < b.minute; });
  grid.slots.erase(std::unique(grid.slots.begin(), grid.slots.end(), [](const Slot& a, const Slot& b) { return a.minute == b.minute; }),
                   grid.slots.end());
  return grid;
}

} // namespace tablebook::core
