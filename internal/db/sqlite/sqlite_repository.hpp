#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tablebook::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  std::unique_ptr<Transaction> BeginBounded(std::chrono::milliseconds budget) override;
  std::string BackendName() const override { return "sqlite"; }

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

  // Maps a sqlite result code onto the portable set. `prepare` marks
  // failures raised while compiling a statement, which are defects in
  // the statement or schema rather than transient conditions.
  static Result Translate(sqlite3* db, int rc, bool prepare = false);

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);

  Result WriteClaims(sqlite3* db, const model::BookingRecord& r);
  std::vector<std::string> ReadClaims(sqlite3* db, const std::string& booking_id);
};

}
