#include "pacing_classifier.hpp"

#include "internal/model/booking_state.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

SlotLoad PacingClassifier::LoadAt(const std::vector<db::model::BookingRecord>& bookings, int slot_minute,
                                  uint32_t interval_minutes, const std::string& exclude_booking_id) {
  SlotLoad   load;
  const int  end = slot_minute + static_cast<int>(interval_minutes > 0 ? interval_minutes : 1);
  for (const auto& booking : bookings) {
    if (!tablebook::model::OccupiesTable(booking.status)) continue;
    if (!exclude_booking_id.empty() && booking.id == exclude_booking_id) continue;
    if (booking.start_minute < slot_minute || booking.start_minute >= end) continue;

    load.committed_covers += booking.party_size;
    ++load.committed_bookings;
  }
  return load;
}

PacingResult PacingClassifier::Classify(const TableAvailability& tables, const SlotLoad& load, uint32_t party_size,
                                        const PacingLimits& limits) {
  PacingResult result;

  if (limits.max_covers_per_slot() > 0) {
    result.utilization_percent = 100.0 * load.committed_covers / limits.max_covers_per_slot();
  } else if (limits.max_bookings_per_slot() > 0) {
    result.utilization_percent = 100.0 * load.committed_bookings / limits.max_bookings_per_slot();
  } else if (tables.active_tables > 0) {
    result.utilization_percent = 100.0 * tables.occupied_tables / tables.active_tables;
  }

  if (!tables.best) {
    result.status       = PACING_STATUS_PHYSICALLY_FULL;
    result.can_override = false;
    return result;
  }
  result.can_override = true;

  const bool covers_full =
      limits.max_covers_per_slot() > 0 && load.committed_covers + party_size > limits.max_covers_per_slot();
  const bool bookings_full =
      limits.max_bookings_per_slot() > 0 && load.committed_bookings >= limits.max_bookings_per_slot();
  if (covers_full || bookings_full) {
    result.status = PACING_STATUS_PACING_FULL;
    return result;
  }

  const double moderate =
      limits.moderate_threshold_percent() > 0 ? limits.moderate_threshold_percent() : kDefaultModerateThresholdPercent;
  const double busy = limits.busy_threshold_percent() > 0 ? limits.busy_threshold_percent() : kDefaultBusyThresholdPercent;

  if (result.utilization_percent >= busy) {
    result.status = PACING_STATUS_BUSY;
  } else if (result.utilization_percent >= moderate) {
    result.status = PACING_STATUS_MODERATE;
  } else {
    result.status = PACING_STATUS_AVAILABLE;
  }
  return result;
}

} // namespace tablebook::core
