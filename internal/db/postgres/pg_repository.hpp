#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tablebook::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginBounded(std::chrono::milliseconds budget) override;
  std::string BackendName() const override { return "postgres"; }

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

  // SQLSTATE -> portable ErrorCode.
  static Result Translate(const std::exception&);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result WriteClaims(pqxx::work& w, const model::BookingRecord& r);
  static std::vector<std::string> ReadClaims(pqxx::work& w, const std::string& booking_id);
};

}
