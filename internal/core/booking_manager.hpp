#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/core/slot_grid_generator.hpp"
#include "internal/core/turn_time_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/util/time.hpp"
#include "tablebook/v1.hpp"

namespace tablebook::core {

struct BookingOptions {
  // Hard cap; a restaurant may configure a lower max_party_size.
  uint32_t max_party_size             = 50;
  uint32_t min_duration_minutes       = 30;
  uint32_t max_duration_minutes       = 480;
  uint32_t min_override_reason_length = 10;
  uint32_t default_interval_minutes   = SlotGridGenerator::kDefaultIntervalMinutes;
};

/*
  Booking mutations.

  Request validation runs before any lock is taken. Every mutation then
  runs inside LockCoordinator::WithLock on the slot key (plus the table
  key for an explicit table request): re-read tables and bookings,
  re-check availability and pacing, persist, commit. The storage
  transaction is bounded by the lease's remaining TTL.

  Failures:
    InvalidArgument   malformed request or violated business rule
    NotFound          unknown restaurant or booking
    RestaurantClosed  the date is a closed day
    CapacityConflict  no table (or the requested table) is free
    OverrideRequired  slot is pacing-full and no override was given
    InvalidState      status transition not allowed
    LockBusy / StorageError after the coordinator gives up
*/
class BookingManager {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                 std::shared_ptr<TurnTimeResolver> turn_times, BookingOptions options = {}, ClockFn clock = util::Now);

  tablebook::v1::Booking Create(const tablebook::v1::CreateBookingRequest& request, std::stop_token stop = {});
  tablebook::v1::Booking Modify(const tablebook::v1::ModifyBookingRequest& request, std::stop_token stop = {});
  tablebook::v1::Booking Cancel(const tablebook::v1::CancelBookingRequest& request, std::stop_token stop = {});
  tablebook::v1::Booking UpdateStatus(const tablebook::v1::UpdateBookingStatusRequest& request, std::stop_token stop = {});

  tablebook::v1::Booking              Get(const std::string& booking_id);
  std::vector<tablebook::v1::Booking> List(const std::string& restaurant_id, const std::string& date);

  const BookingOptions& Options() const {
    return options_;
  }

 private:
  struct Target;

  Target Validate(const std::string& restaurant_id, const std::string& date, const std::string& time, uint32_t party_size,
                  uint32_t duration_minutes, bool override_pacing, const std::string& override_reason,
                  tablebook::v1::BookingSource source);

  // Assigns tables and persists `draft` under the slot lock. With
  // `update` the stored row is re-read and its version bumped.
  db::model::BookingRecord Place(const Target& target, const db::model::BookingRecord& draft, bool update,
                                 const std::string& requested_table_id, const std::string& preferred_table_id,
                                 std::stop_token stop);

  tablebook::v1::Booking Transition(const std::string& booking_id, tablebook::v1::BookingStatus status, const std::string& note,
                                    std::stop_token stop);

  db::model::BookingRecord LoadBooking(const std::string& booking_id);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<lock::LockCoordinator> locks_;
  std::shared_ptr<TurnTimeResolver>      turn_times_;
  BookingOptions                         options_;
  ClockFn                                clock_;
};

} // namespace tablebook::core
