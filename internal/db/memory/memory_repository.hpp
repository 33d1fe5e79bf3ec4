#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tablebook::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::string BackendName() const override { return "memory"; }

  Result UpsertRestaurant(Transaction&, const model::RestaurantRecord&) override;
  std::optional<model::RestaurantRecord> GetRestaurant(Transaction&, const std::string&) override;

  Result UpsertTable(Transaction&, const model::TableRecord&) override;
  Result DeactivateTable(Transaction&, const std::string&) override;
  std::vector<model::TableRecord> ListTables(Transaction&, const std::string&) override;

  Result UpsertTurnTimeRule(Transaction&, const model::TurnTimeRuleRecord&) override;
  std::vector<model::TurnTimeRuleRecord> ListTurnTimeRules(Transaction&, const std::string&) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  std::vector<model::BookingRecord> ListBookings(Transaction&, const std::string& restaurant_id,
                                                 const std::string& date) override;

  // True if `candidate` would double-book a table held by another
  // occupying booking in `bookings`.
  static bool HasOverlappingClaim(const std::unordered_map<std::string, model::BookingRecord>& bookings,
                                  const model::BookingRecord& candidate);

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RestaurantRecord>   restaurants;
    std::unordered_map<std::string, model::TableRecord>        tables;
    std::unordered_map<std::string, model::TurnTimeRuleRecord> turn_time_rules;
    std::unordered_map<std::string, model::BookingRecord>      bookings;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
