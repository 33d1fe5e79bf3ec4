#include <assert.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <latch>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "booking_fixtures.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using tablebook::core::BookingManager;
using tablebook::core::TurnTimeResolver;
using tablebook::db::Repository;
using tablebook::db::Result;
using tablebook::db::Transaction;
using tablebook::db::memory::MemoryRepository;
using tablebook::lock::LockCoordinator;
using tablebook::testing::CreateRequest;
using tablebook::testing::Engine;
using tablebook::testing::FastLocks;
using tablebook::testing::FixedNow;
using tablebook::testing::kDate;
using tablebook::testing::MakeRestaurant;
using tablebook::testing::MakeTable;
using tablebook::testing::Book;
using tablebook::testing::Seed;

namespace model = tablebook::db::model;
namespace util  = tablebook::util;

class HookedRepository : public Repository {
 public:
  std::function<Result(Transaction&, const model::BookingRecord&)> on_insert;
  std::function<void()>                                             on_list_bookings;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  std::string BackendName() const override {
    return "hooked-memory";
  }

  Result UpsertRestaurant(Transaction& tx, const model::RestaurantRecord& record) override {
    return inner_.UpsertRestaurant(tx, record);
  }
  std::optional<model::RestaurantRecord> GetRestaurant(Transaction& tx, const std::string& id) override {
    return inner_.GetRestaurant(tx, id);
  }
  Result UpsertTable(Transaction& tx, const model::TableRecord& record) override {
    return inner_.UpsertTable(tx, record);
  }
  Result DeactivateTable(Transaction& tx, const std::string& id) override {
    return inner_.DeactivateTable(tx, id);
  }
  std::vector<model::TableRecord> ListTables(Transaction& tx, const std::string& restaurant_id) override {
    return inner_.ListTables(tx, restaurant_id);
  }
  Result UpsertTurnTimeRule(Transaction& tx, const model::TurnTimeRuleRecord& record) override {
    return inner_.UpsertTurnTimeRule(tx, record);
  }
  std::vector<model::TurnTimeRuleRecord> ListTurnTimeRules(Transaction& tx, const std::string& restaurant_id) override {
    return inner_.ListTurnTimeRules(tx, restaurant_id);
  }

  Result InsertBooking(Transaction& tx, const model::BookingRecord& record) override {
    if (on_insert) {
      auto result = on_insert(tx, record);
      if (!result) return result;
    }
    return inner_.InsertBooking(tx, record);
  }
  Result UpdateBooking(Transaction& tx, const model::BookingRecord& record) override {
    return inner_.UpdateBooking(tx, record);
  }
  std::optional<model::BookingRecord> GetBooking(Transaction& tx, const std::string& id) override {
    return inner_.GetBooking(tx, id);
  }
  std::vector<model::BookingRecord> ListBookings(Transaction& tx, const std::string& restaurant_id,
                                                 const std::string& date) override {
    if (on_list_bookings) on_list_bookings();
    return inner_.ListBookings(tx, restaurant_id, date);
  }

 private:
  MemoryRepository inner_;
};

struct Outcome {
  std::atomic<int> created{0};
  std::atomic<int> conflicts{0};
  std::atomic<int> other{0};
};

void Race(BookingManager& bookings, const std::vector<std::string>& times, int per_time, Outcome& outcome) {
  const auto threads = static_cast<std::ptrdiff_t>(times.size()) * per_time;
  std::latch start(threads);

  std::vector<std::thread> workers;
  for (const auto& time : times) {
    for (int i = 0; i < per_time; ++i) {
      workers.emplace_back([&, time] {
        start.arrive_and_wait();
        try {
          bookings.Create(CreateRequest(time, 2, 90));
          outcome.created.fetch_add(1);
        } catch (const util::CapacityConflict&) {
          outcome.conflicts.fetch_add(1);
        } catch (const std::exception& e) {
          std::cerr << "unexpected: " << e.what() << "\n";
          outcome.other.fetch_add(1);
        }
      });
    }
  }
  for (auto& worker : workers) worker.join();
}

void TestSameSlotHasExactlyOneWinner() {
  Engine engine;
  Seed(*engine.repository, MakeRestaurant(), {MakeTable("t1", 2, 4)});

  Outcome outcome;
  Race(*engine.bookings, {"19:00"}, 16, outcome);

  assert(outcome.created.load() == 1);
  assert(outcome.conflicts.load() == 15);
  assert(outcome.other.load() == 0);
  assert(engine.bookings->List("bistro", kDate).size() == 1);
  assert(engine.locks->Stats().total == 0);
}

void TestOverlappingSlotsNeverDoubleBook() {
  Engine engine;
  Seed(*engine.repository, MakeRestaurant(), {MakeTable("t1", 2, 4)});

  // different slot keys, one table: only the storage guard sees the clash
  Outcome outcome;
  Race(*engine.bookings, {"18:30", "19:00", "19:30"}, 6, outcome);

  assert(outcome.created.load() == 1);
  assert(outcome.conflicts.load() == 17);
  assert(outcome.other.load() == 0);

  const auto listed = engine.bookings->List("bistro", kDate);
  assert(listed.size() == 1);
  assert(listed.front().table_id() == "t1");
}

void TestEveryTableIsUsedOnceUnderContention() {
  Engine engine;
  Seed(*engine.repository, MakeRestaurant(),
       {MakeTable("t1", 2, 4), MakeTable("t2", 2, 4), MakeTable("t3", 2, 4), MakeTable("t4", 2, 4)});

  Outcome outcome;
  Race(*engine.bookings, {"19:00"}, 12, outcome);

  assert(outcome.created.load() == 4);
  assert(outcome.conflicts.load() == 8);

  std::vector<std::string> tables;
  for (const auto& booking : engine.bookings->List("bistro", kDate)) tables.push_back(booking.table_id());
  std::sort(tables.begin(), tables.end());
  assert(tables == (std::vector<std::string>{"t1", "t2", "t3", "t4"}));
}

void TestTransientStorageFailureIsRetried() {
  auto repository = std::make_shared<HookedRepository>();
  auto locks      = std::make_shared<LockCoordinator>(FastLocks());
  auto turn_times = std::make_shared<TurnTimeResolver>(repository);
  BookingManager bookings(repository, locks, turn_times, {}, FixedNow);
  Seed(*repository, MakeRestaurant(), {MakeTable("t1", 2, 4)});

  std::atomic<int> inserts{0};
  repository->on_insert = [&](Transaction&, const model::BookingRecord&) {
    if (inserts.fetch_add(1) == 0) return Result::Err(tablebook::db::ErrorCode::SerializationFailure, "could not serialize");
    return Result::Ok();
  };

  auto booking = bookings.Create(CreateRequest("19:00", 2, 90));
  assert(inserts.load() == 2);
  assert(booking.table_id() == "t1");
  assert(bookings.List("bistro", kDate).size() == 1);
}

void TestPermanentStorageFailureIsNotRetried() {
  auto repository = std::make_shared<HookedRepository>();
  auto locks      = std::make_shared<LockCoordinator>(FastLocks());
  auto turn_times = std::make_shared<TurnTimeResolver>(repository);
  BookingManager bookings(repository, locks, turn_times, {}, FixedNow);
  Seed(*repository, MakeRestaurant(), {MakeTable("t1", 2, 4)});

  std::atomic<int> inserts{0};
  repository->on_insert = [&](Transaction&, const model::BookingRecord&) {
    inserts.fetch_add(1);
    return Result::Err(tablebook::db::ErrorCode::UndefinedColumn, "no such column: party_size");
  };

  bool storage = false;
  try {
    bookings.Create(CreateRequest("19:00", 2, 90));
  } catch (const util::StorageError& e) {
    storage = e.code() == tablebook::db::ErrorCode::UndefinedColumn;
  }
  assert(storage);
  assert(inserts.load() == 1);
  assert(bookings.List("bistro", kDate).empty());
}

void TestLapsedLockIsNotCommitted() {
  auto repository = std::make_shared<HookedRepository>();
  auto options    = FastLocks();
  options.ttl     = std::chrono::milliseconds(40);
  auto locks      = std::make_shared<LockCoordinator>(options);
  auto turn_times = std::make_shared<TurnTimeResolver>(repository);
  BookingManager bookings(repository, locks, turn_times, {}, FixedNow);
  Seed(*repository, MakeRestaurant(), {MakeTable("t1", 2, 4)});

  // the first attempt stalls past the lock TTL
  std::atomic<int> reads{0};
  repository->on_list_bookings = [&] {
    if (reads.fetch_add(1) == 0) std::this_thread::sleep_for(std::chrono::milliseconds(150));
  };
  std::atomic<int> inserts{0};
  repository->on_insert = [&](Transaction&, const model::BookingRecord&) {
    inserts.fetch_add(1);
    return Result::Ok();
  };

  auto booking = bookings.Create(CreateRequest("19:00", 2, 90));
  assert(booking.table_id() == "t1");
  assert(reads.load() >= 2);
  assert(inserts.load() == 1);
  assert(bookings.List("bistro", kDate).size() == 1);
}

void TestOffGridTimesShareTheSlotCeiling() {
  auto repository = std::make_shared<HookedRepository>();
  auto locks      = std::make_shared<LockCoordinator>(FastLocks());
  auto turn_times = std::make_shared<TurnTimeResolver>(repository);
  BookingManager bookings(repository, locks, turn_times, {}, FixedNow);

  auto restaurant = MakeRestaurant();
  restaurant.mutable_pacing()->set_max_covers_per_slot(20);
  Seed(*repository, restaurant,
       {MakeTable("t1", 2, 6), MakeTable("t2", 2, 6), MakeTable("t3", 2, 6), MakeTable("t4", 2, 6), MakeTable("t5", 2, 6)});
  Book(*repository, "b1", {"t1"}, "19:00", 4);
  Book(*repository, "b2", {"t2"}, "19:00", 6);
  Book(*repository, "b3", {"t3"}, "19:00", 6);

  // widen the window between reading the slot load and committing
  repository->on_list_bookings = [] { std::this_thread::sleep_for(std::chrono::milliseconds(100)); };

  std::atomic<int> created{0};
  std::atomic<int> override_required{0};
  std::atomic<int> other{0};
  std::latch       start(2);

  std::vector<std::thread> workers;
  for (const std::string time : {"19:00", "19:10"}) {
    workers.emplace_back([&, time] {
      start.arrive_and_wait();
      try {
        bookings.Create(CreateRequest(time, 4, 90));
        created.fetch_add(1);
      } catch (const util::OverrideRequired&) {
        override_required.fetch_add(1);
      } catch (const std::exception& e) {
        std::cerr << "unexpected: " << e.what() << "\n";
        other.fetch_add(1);
      }
    });
  }
  for (auto& worker : workers) worker.join();
  repository->on_list_bookings = nullptr;

  assert(created.load() == 1);
  assert(override_required.load() == 1);
  assert(other.load() == 0);

  uint32_t covers = 0;
  for (const auto& booking : bookings.List("bistro", kDate)) {
    assert(!booking.pacing_overridden());
    covers += booking.party_size();
  }
  assert(covers == 20);
  assert(locks->Stats().total == 0);
}

} // namespace

int main() {
  TestSameSlotHasExactlyOneWinner();
  TestOverlappingSlotsNeverDoubleBook();
  TestEveryTableIsUsedOnceUnderContention();
  TestTransientStorageFailureIsRetried();
  TestPermanentStorageFailureIsNotRetried();
  TestLapsedLockIsNotCommitted();
  TestOffGridTimesShareTheSlotCeiling();

  std::cout << "tablebook_unit_booking_concurrency: pass\n";
  return 0;
}
