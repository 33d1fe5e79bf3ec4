#include "internal/core/turn_time_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "booking_fixtures.hpp"
#include "internal/util/errors.hpp"

namespace {

using tablebook::core::TurnTimeResolver;
using tablebook::db::Repository;
using tablebook::db::Result;
using tablebook::db::Transaction;
using tablebook::db::memory::MemoryRepository;
using tablebook::testing::MakeRestaurant;
using tablebook::testing::MakeRule;
using tablebook::testing::Seed;
using tablebook::v1::TurnTimeRule;

namespace model = tablebook::db::model;

// Delegates to memory storage but fails every turn-time rule read.
class RulesUnavailableRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  std::string BackendName() const override {
    return "rules-unavailable";
  }

  Result UpsertRestaurant(Transaction& tx, const model::RestaurantRecord& r) override {
    return inner_.UpsertRestaurant(tx, r);
  }
  std::optional<model::RestaurantRecord> GetRestaurant(Transaction& tx, const std::string& id) override {
    return inner_.GetRestaurant(tx, id);
  }
  Result UpsertTable(Transaction& tx, const model::TableRecord& r) override {
    return inner_.UpsertTable(tx, r);
  }
  Result DeactivateTable(Transaction& tx, const std::string& id) override {
    return inner_.DeactivateTable(tx, id);
  }
  std::vector<model::TableRecord> ListTables(Transaction& tx, const std::string& id) override {
    return inner_.ListTables(tx, id);
  }
  Result UpsertTurnTimeRule(Transaction& tx, const model::TurnTimeRuleRecord& r) override {
    return inner_.UpsertTurnTimeRule(tx, r);
  }
  std::vector<model::TurnTimeRuleRecord> ListTurnTimeRules(Transaction&, const std::string&) override {
    throw tablebook::util::StorageError(tablebook::db::ErrorCode::UndefinedTable, "no such table: turn_time_rules");
  }
  Result InsertBooking(Transaction& tx, const model::BookingRecord& r) override {
    return inner_.InsertBooking(tx, r);
  }
  Result UpdateBooking(Transaction& tx, const model::BookingRecord& r) override {
    return inner_.UpdateBooking(tx, r);
  }
  std::optional<model::BookingRecord> GetBooking(Transaction& tx, const std::string& id) override {
    return inner_.GetBooking(tx, id);
  }
  std::vector<model::BookingRecord> ListBookings(Transaction& tx, const std::string& id, const std::string& date) override {
    return inner_.ListBookings(tx, id, date);
  }

 private:
  MemoryRepository inner_;
};

void TestNoRulesFallsBackToDefault() {
  assert(TurnTimeResolver::Select({}, 4, 120) == 120);
  assert(TurnTimeResolver::Select({}, 1, 90) == 90);
}

void TestHigherPriorityBeatsNarrowerRange() {
  std::vector<TurnTimeRule> rules{MakeRule("wide", 1, 8, 150, 5), MakeRule("narrow", 3, 4, 90, 1)};
  assert(TurnTimeResolver::Select(rules, 4, 120) == 150);
}

void TestNarrowestRangeWinsOnEqualPriority() {
  std::vector<TurnTimeRule> rules{MakeRule("wide", 1, 8, 150), MakeRule("narrow", 3, 4, 90), MakeRule("mid", 2, 6, 100)};
  assert(TurnTimeResolver::Select(rules, 4, 120) == 90);
  assert(TurnTimeResolver::Select(rules, 6, 120) == 100);
  assert(TurnTimeResolver::Select(rules, 8, 120) == 150);
  assert(TurnTimeResolver::Select(rules, 9, 120) == 120);
}

void TestTiesBreakOnLowerMinimumThenId() {
  std::vector<TurnTimeRule> rules{MakeRule("b", 4, 6, 100), MakeRule("a", 3, 5, 80)};
  assert(TurnTimeResolver::Select(rules, 4, 120) == 80);

  std::vector<TurnTimeRule> same{MakeRule("z", 2, 4, 70), MakeRule("m", 2, 4, 75)};
  assert(TurnTimeResolver::Select(same, 3, 120) == 75);
}

void TestInactiveAndZeroDurationRulesAreIgnored() {
  auto inactive = MakeRule("inactive", 1, 10, 45, 10);
  inactive.set_active(false);
  std::vector<TurnTimeRule> rules{inactive, MakeRule("zero", 1, 10, 0, 9), MakeRule("real", 1, 10, 105)};
  assert(TurnTimeResolver::Select(rules, 2, 120) == 105);
}

void TestResolveReadsStoredRules() {
  auto repository = std::make_shared<MemoryRepository>();
  Seed(*repository, MakeRestaurant(), {}, {MakeRule("small", 1, 2, 75), MakeRule("large", 5, 12, 150)});

  TurnTimeResolver resolver(repository);
  assert(resolver.ResolveDuration("bistro", 2) == 75);
  assert(resolver.ResolveDuration("bistro", 8) == 150);
  assert(resolver.ResolveDuration("bistro", 4) == 120);
  assert(resolver.ResolveDuration("unknown", 4) == 120);
}

void TestStorageFailureFallsBackToDefault() {
  auto repository = std::make_shared<RulesUnavailableRepository>();
  TurnTimeResolver resolver(repository, 100);
  assert(resolver.ResolveDuration("bistro", 4) == 100);
  assert(resolver.DefaultMinutes() == 100);
}

} // namespace

int main() {
  TestNoRulesFallsBackToDefault();
  TestHigherPriorityBeatsNarrowerRange();
  TestNarrowestRangeWinsOnEqualPriority();
  TestTiesBreakOnLowerMinimumThenId();
  TestInactiveAndZeroDurationRulesAreIgnored();
  TestResolveReadsStoredRules();
  TestStorageFailureFallsBackToDefault();

  std::cout << "tablebook_unit_turn_time_resolver: pass\n";
  return 0;
}
