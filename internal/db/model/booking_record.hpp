#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tablebook/core/v1/types.pb.h"

namespace tablebook::db::model {

/*
  Persistent booking row plus its table claims.

  IMPORTANT:
  - table_ids[0] is the primary table, further entries are joined tables.
  - Every backend rejects a write that would leave two occupying
    bookings on one table with overlapping [start, start+duration).
  - version is bumped by the caller on every update and checked by the
    backend (optimistic concurrency).
*/
struct BookingRecord {
  std::string id;
  std::string restaurant_id;
  std::string date; // YYYY-MM-DD

  int32_t  start_minute     = 0;
  uint32_t duration_minutes = 0;
  uint32_t party_size       = 0;

  tablebook::core::v1::BookingStatus status = tablebook::core::v1::BOOKING_STATUS_UNSPECIFIED;
  tablebook::core::v1::BookingSource source = tablebook::core::v1::BOOKING_SOURCE_UNSPECIFIED;

  std::vector<std::string> table_ids;

  std::string customer_name;
  std::string customer_email;
  std::string customer_phone;
  std::string notes;

  bool        pacing_overridden = false;
  std::string override_reason;
  std::string created_by;
  std::string confirmation_code;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t version       = 1;
};

} // namespace tablebook::db::model
