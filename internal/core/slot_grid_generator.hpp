#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

struct Slot {
  int         minute = 0; // minutes since local midnight
  std::string time;       // HH:MM
  std::string period;
  uint32_t    interval_minutes = 0;
};

struct SlotGrid {
  bool              open = false;
  std::vector<Slot> slots;
};

/*
  Bookable time points of one restaurant day, independent of bookings.

  Each open service period emits start, start+interval, ... up to and
  including end - last_seating_offset. Periods are never bridged: lunch
  and dinner produce disjoint runs. Interval precedence is the period
  override, then the restaurant setting, then the caller's interval.
*/
class SlotGridGenerator {
 public:
  static constexpr uint32_t kDefaultIntervalMinutes = 30;

  SlotGrid Generate(const tablebook::v1::Restaurant& restaurant, const util::Date& date,
                    uint32_t interval_minutes = kDefaultIntervalMinutes) const;

  static const tablebook::v1::DaySchedule& DayFor(const tablebook::v1::OperatingSchedule& schedule,
                                                  const util::Date&                       date);

  // Slot spacing inside `period`: its own override, then the restaurant
  // setting, then `fallback`.
  static uint32_t IntervalFor(const tablebook::v1::Restaurant& restaurant, const tablebook::v1::ServicePeriod& period,
                              uint32_t fallback = kDefaultIntervalMinutes);

  // Service period containing `minute` (start inclusive, end inclusive), or
  // nullptr when the restaurant is closed then.
  static const tablebook::v1::ServicePeriod* PeriodAt(const tablebook::v1::Restaurant& restaurant,
                                                      const util::Date& date, int minute);
};

} // namespace tablebook::core
