#pragma once

namespace tablebook::model {

/*
  Half-open occupancy window [start, end) in minutes since local
  midnight of the booking date. `end` may run past 24:00.
*/
struct Interval {
  int start = 0;
  int end   = 0;

  constexpr bool Overlaps(const Interval& other) const {
    return start < other.end && other.start < end;
  }
};

constexpr Interval MakeInterval(int start_minute, int duration_minutes) {
  return Interval{start_minute, start_minute + duration_minutes};
}

} // namespace tablebook::model
