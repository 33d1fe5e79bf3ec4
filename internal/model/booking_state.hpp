#pragma once

#include "tablebook/core/v1/types.pb.h"

namespace tablebook::model {

using BookingStatus = tablebook::core::v1::BookingStatus;

constexpr bool IsTerminal(BookingStatus status) {
  return status == tablebook::core::v1::BOOKING_STATUS_COMPLETED || status == tablebook::core::v1::BOOKING_STATUS_CANCELLED ||
         status == tablebook::core::v1::BOOKING_STATUS_NO_SHOW;
}

// Only a cancelled booking gives its table back. A no-show keeps the
// table blocked for the rest of its turn.
constexpr bool OccupiesTable(BookingStatus status) {
  return status != tablebook::core::v1::BOOKING_STATUS_CANCELLED && status != tablebook::core::v1::BOOKING_STATUS_UNSPECIFIED;
}

constexpr bool CanTransition(BookingStatus from, BookingStatus to) {
  using namespace tablebook::core::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == BOOKING_STATUS_UNSPECIFIED || to == BOOKING_STATUS_PENDING) {
    return false;
  }

  switch (from) {
    case BOOKING_STATUS_PENDING:
      return to == BOOKING_STATUS_CONFIRMED || to == BOOKING_STATUS_SEATED || to == BOOKING_STATUS_CANCELLED ||
             to == BOOKING_STATUS_NO_SHOW;
    case BOOKING_STATUS_CONFIRMED:
      return to == BOOKING_STATUS_SEATED || to == BOOKING_STATUS_CANCELLED || to == BOOKING_STATUS_NO_SHOW;
    case BOOKING_STATUS_SEATED:
      return to == BOOKING_STATUS_COMPLETED;
    default:
      return false;
  }
}

} // namespace tablebook::model
