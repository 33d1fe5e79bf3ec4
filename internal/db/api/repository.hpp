#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/restaurant_record.hpp"
#include "internal/db/model/table_record.hpp"
#include "internal/db/model/turn_time_rule_record.hpp"

namespace tablebook::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Booking writes are rejected with ConstraintViolation when they would
    double-book a table (last-resort guard behind the booking lock)
  - Booking updates are rejected with Conflict when the stored version
    is not record.version - 1
  - Reads throw util::StorageError on backend failure; they never
    report a failure as "not found"

  The DB is the source of truth for:
    restaurants, tables, turn-time rules
    bookings and their table claims
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Snapshot for availability reads. Never committed.
  virtual std::unique_ptr<Transaction> BeginRead() {
    return Begin();
  }

  // Write transaction whose statements are aborted with ErrorCode::Timeout
  // once `budget` has elapsed. Used inside the booking lock so a hung
  // statement cannot outlive the lock TTL.
  virtual std::unique_ptr<Transaction> BeginBounded(std::chrono::milliseconds budget) {
    (void)budget;
    return Begin();
  }

  // Short backend label used in logs and health output.
  virtual std::string BackendName() const = 0;

  // ---------------------------------------------------------------------
  // Restaurants
  // ---------------------------------------------------------------------

  virtual Result UpsertRestaurant(Transaction&, const model::RestaurantRecord&) = 0;

  virtual std::optional<model::RestaurantRecord> GetRestaurant(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Table inventory
  // ---------------------------------------------------------------------

  virtual Result UpsertTable(Transaction&, const model::TableRecord&) = 0;

  virtual Result DeactivateTable(Transaction&, const std::string& id) = 0;

  // Includes inactive tables; callers filter.
  virtual std::vector<model::TableRecord> ListTables(Transaction&, const std::string& restaurant_id) = 0;

  // ---------------------------------------------------------------------
  // Turn-time rules
  // ---------------------------------------------------------------------

  virtual Result UpsertTurnTimeRule(Transaction&, const model::TurnTimeRuleRecord&) = 0;

  virtual std::vector<model::TurnTimeRuleRecord> ListTurnTimeRules(Transaction&, const std::string& restaurant_id) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual Result UpdateBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  // All bookings of a restaurant on one date, any status, ordered by start.
  virtual std::vector<model::BookingRecord> ListBookings(Transaction&, const std::string& restaurant_id, const std::string& date) = 0;
};

} // namespace tablebook::db
