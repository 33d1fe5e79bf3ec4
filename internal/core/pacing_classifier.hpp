#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/table_assignment_resolver.hpp"
#include "internal/db/model/booking_record.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

// Demand already committed at one slot.
struct SlotLoad {
  uint32_t committed_covers   = 0;
  uint32_t committed_bookings = 0;
};

struct PacingResult {
  tablebook::v1::PacingStatus status              = tablebook::v1::PACING_STATUS_UNSPECIFIED;
  double                      utilization_percent = 0.0;
  bool                        can_override        = false;
};

/*
  Status ladder, first match wins:
    PHYSICALLY_FULL  no table (or combination) free for the interval
    PACING_FULL      covers + party > max_covers_per_slot, or
                     bookings >= max_bookings_per_slot
    BUSY             utilization >= busy threshold
    MODERATE         utilization >= moderate threshold
    AVAILABLE        otherwise

  Utilization is committed covers over the cover ceiling; without one,
  bookings over the booking ceiling; without either, the share of
  active tables occupied. It is not clamped above 100.
*/
class PacingClassifier {
 public:
  static constexpr double kDefaultModerateThresholdPercent = 40.0;
  static constexpr double kDefaultBusyThresholdPercent     = 70.0;

  // Occupying bookings that start in [slot_minute, slot_minute + interval).
  static SlotLoad LoadAt(const std::vector<db::model::BookingRecord>& bookings, int slot_minute,
                         uint32_t interval_minutes, const std::string& exclude_booking_id = {});

  static PacingResult Classify(const TableAvailability& tables, const SlotLoad& load, uint32_t party_size,
                               const tablebook::v1::PacingLimits& limits);
};

} // namespace tablebook::core
