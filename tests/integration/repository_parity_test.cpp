#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/restaurant_record.hpp"
#include "internal/db/model/table_record.hpp"
#include "internal/db/model/turn_time_rule_record.hpp"
#include "internal/util/errors.hpp"

#if TABLEBOOK_DB_SQLITE || TABLEBOOK_DB_POSTGRES
#include "internal/db/sql/schema.hpp"
#endif

#if TABLEBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TABLEBOOK_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using tablebook::core::v1::BOOKING_SOURCE_STAFF;
using tablebook::core::v1::BOOKING_STATUS_CANCELLED;
using tablebook::core::v1::BOOKING_STATUS_CONFIRMED;
using tablebook::core::v1::BOOKING_STATUS_SEATED;
using tablebook::db::ErrorCode;
using tablebook::db::Repository;
using tablebook::db::Transaction;
using tablebook::db::memory::MemoryRepository;
using tablebook::db::model::BookingRecord;
using tablebook::db::model::RestaurantRecord;
using tablebook::db::model::TableRecord;
using tablebook::db::model::TurnTimeRuleRecord;

constexpr const char* kDate = "2030-06-14";

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

TableRecord MakeTable(const std::string& restaurant_id, const std::string& id, uint32_t max_capacity) {
  TableRecord t;
  t.id                 = id;
  t.restaurant_id      = restaurant_id;
  t.number             = id;
  t.min_capacity       = 1;
  t.max_capacity       = max_capacity;
  t.combinable         = true;
  t.priority           = 1;
  t.section            = "main";
  t.adjacent_table_ids = {};
  return t;
}

void SeedRestaurant(Repository& repo, Transaction& tx, const std::string& restaurant_id) {
  RestaurantRecord restaurant{.id = restaurant_id, .name = restaurant_id, .definition_json = "{}", .updated_at_ms = NowMs()};
  assert(repo.UpsertRestaurant(tx, restaurant));
}

BookingRecord MakeBooking(const std::string& restaurant_id, const std::string& id, std::vector<std::string> tables, int32_t start_minute,
                          uint32_t duration_minutes) {
  BookingRecord b;
  b.id                = id;
  b.restaurant_id     = restaurant_id;
  b.date              = kDate;
  b.start_minute      = start_minute;
  b.duration_minutes  = duration_minutes;
  b.party_size        = 2;
  b.status            = BOOKING_STATUS_CONFIRMED;
  b.source            = BOOKING_SOURCE_STAFF;
  b.table_ids         = std::move(tables);
  b.customer_name     = "Ada Guest";
  b.customer_email    = "ada@example.com";
  b.created_by        = "host";
  b.confirmation_code = "TB-" + id;
  b.created_at_ms     = NowMs();
  b.updated_at_ms     = b.created_at_ms;
  b.version           = 1;
  return b;
}

void VerifyCatalogReadWrite(Repository& repo, const std::string& restaurant_id) {
  {
    auto tx = repo.Begin();

    RestaurantRecord restaurant{.id = restaurant_id, .name = "Bistro", .definition_json = R"({"id":"bistro"})", .updated_at_ms = NowMs()};
    assert(repo.UpsertRestaurant(*tx, restaurant));
    SeedRestaurant(repo, *tx, "elsewhere-" + restaurant_id);

    auto t2               = MakeTable(restaurant_id, restaurant_id + "-t2", 4);
    t2.adjacent_table_ids = {restaurant_id + "-t1"};
    assert(repo.UpsertTable(*tx, t2));
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, restaurant_id + "-t1", 2)));
    assert(repo.UpsertTable(*tx, MakeTable("elsewhere-" + restaurant_id, restaurant_id + "-other", 8)));

    TurnTimeRuleRecord large{.id               = restaurant_id + "-r2",
                             .restaurant_id    = restaurant_id,
                             .name             = "large",
                             .min_party_size   = 5,
                             .max_party_size   = 8,
                             .duration_minutes = 150,
                             .priority         = 1,
                             .active           = true};
    TurnTimeRuleRecord small = large;
    small.id                 = restaurant_id + "-r1";
    small.name               = "small";
    small.min_party_size     = 1;
    small.max_party_size     = 2;
    small.duration_minutes   = 75;
    assert(repo.UpsertTurnTimeRule(*tx, large));
    assert(repo.UpsertTurnTimeRule(*tx, small));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    auto restaurant = repo.GetRestaurant(*tx, restaurant_id);
    assert(restaurant.has_value());
    assert(restaurant->name == "Bistro");
    assert(restaurant->definition_json == R"({"id":"bistro"})");
    assert(!repo.GetRestaurant(*tx, restaurant_id + "-missing").has_value());

    auto tables = repo.ListTables(*tx, restaurant_id);
    assert(tables.size() == 2);
    assert(tables[0].id == restaurant_id + "-t1");
    assert(tables[1].id == restaurant_id + "-t2");
    assert(tables[1].max_capacity == 4);
    assert(tables[1].combinable);
    assert(tables[1].active);
    assert(tables[1].section == "main");
    assert(tables[1].adjacent_table_ids.size() == 1);
    assert(tables[1].adjacent_table_ids[0] == restaurant_id + "-t1");

    auto rules = repo.ListTurnTimeRules(*tx, restaurant_id);
    assert(rules.size() == 2);
    assert(rules[0].id == restaurant_id + "-r1");
    assert(rules[0].duration_minutes == 75);
    assert(rules[1].min_party_size == 5);
    assert(rules[1].max_party_size == 8);

    auto result = repo.DeactivateTable(*tx, restaurant_id + "-t1");
    assert(result);
    auto missing = repo.DeactivateTable(*tx, restaurant_id + "-none");
    assert(!missing);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx     = repo.BeginRead();
    auto tables = repo.ListTables(*tx, restaurant_id);
    assert(tables.size() == 2);
    assert(!tables[0].active);
    assert(tables[1].active);
    tx->Commit();
  }
}

void VerifyBookingReadWrite(Repository& repo, const std::string& restaurant_id) {
  const auto table_a = restaurant_id + "-a";
  const auto table_b = restaurant_id + "-b";
  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, table_a, 4)));
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, table_b, 4)));

    auto late  = MakeBooking(restaurant_id, restaurant_id + "-late", {table_a}, 20 * 60, 90);
    auto early = MakeBooking(restaurant_id, restaurant_id + "-early", {table_a, table_b}, 18 * 60, 90);
    assert(repo.InsertBooking(*tx, late));
    assert(repo.InsertBooking(*tx, early));
    tx->Commit();
  }

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-late", {table_b}, 21 * 60, 60));
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();

    auto bookings = repo.ListBookings(*tx, restaurant_id, kDate);
    assert(bookings.size() == 2);
    assert(bookings[0].id == restaurant_id + "-early");
    assert(bookings[1].id == restaurant_id + "-late");
    assert(bookings[0].table_ids.size() == 2);
    assert(bookings[0].table_ids[0] == table_a);
    assert(bookings[0].table_ids[1] == table_b);
    assert(bookings[0].status == BOOKING_STATUS_CONFIRMED);
    assert(bookings[0].source == BOOKING_SOURCE_STAFF);
    assert(bookings[0].confirmation_code == "TB-" + restaurant_id + "-early");
    assert(repo.ListBookings(*tx, restaurant_id, "2030-06-15").empty());

    auto fetched = repo.GetBooking(*tx, restaurant_id + "-late");
    assert(fetched.has_value());
    assert(fetched->start_minute == 20 * 60);
    assert(fetched->duration_minutes == 90);
    assert(fetched->customer_email == "ada@example.com");
    assert(fetched->version == 1);
    assert(!repo.GetBooking(*tx, restaurant_id + "-none").has_value());
    tx->Commit();
  }
}

void VerifyOverlappingClaimsRejected(Repository& repo, const std::string& restaurant_id) {
  const auto table = restaurant_id + "-solo";
  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, table, 2)));
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-first", {table}, 19 * 60, 90)));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto result = repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-clash", {table}, 20 * 60, 90));
    assert(!result);
    assert(result.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    // end is exclusive, a cancelled booking claims nothing
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-after", {table}, 19 * 60 + 90, 60)));

    auto cancelled   = MakeBooking(restaurant_id, restaurant_id + "-cancelled", {table}, 19 * 60 + 30, 60);
    cancelled.status = BOOKING_STATUS_CANCELLED;
    assert(repo.InsertBooking(*tx, cancelled));
    tx->Commit();
  }

  {
    // reactivating the cancelled booking would overlap the first one
    auto tx        = repo.Begin();
    auto cancelled = repo.GetBooking(*tx, restaurant_id + "-cancelled");
    assert(cancelled.has_value());
    cancelled->status  = BOOKING_STATUS_CONFIRMED;
    cancelled->version = 2;
    auto result        = repo.UpdateBooking(*tx, *cancelled);
    assert(!result);
    assert(result.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
}

void VerifyOptimisticUpdates(Repository& repo, const std::string& restaurant_id) {
  const auto table = restaurant_id + "-t";
  const auto id    = restaurant_id + "-booking";
  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, table, 4)));
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, id, {table}, 18 * 60, 90)));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto current = repo.GetBooking(*tx, id);
    assert(current.has_value());

    current->status        = BOOKING_STATUS_SEATED;
    current->notes         = "window seat";
    current->start_minute  = 18 * 60 + 30;
    current->version       = 2;
    current->updated_at_ms = NowMs();
    assert(repo.UpdateBooking(*tx, *current));

    auto stale    = *current;
    stale.version = 2;
    auto result   = repo.UpdateBooking(*tx, stale);
    assert(!result);
    assert(result.code == ErrorCode::Conflict);

    auto ghost    = *current;
    ghost.id      = restaurant_id + "-ghost";
    ghost.version = 2;
    auto missing  = repo.UpdateBooking(*tx, ghost);
    assert(!missing);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx     = repo.BeginRead();
    auto stored = repo.GetBooking(*tx, id);
    assert(stored.has_value());
    assert(stored->version == 2);
    assert(stored->status == BOOKING_STATUS_SEATED);
    assert(stored->notes == "window seat");
    assert(stored->start_minute == 18 * 60 + 30);
    assert(stored->table_ids.size() == 1);
    assert(stored->table_ids[0] == table);
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& restaurant_id) {
  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, restaurant_id + "-t", 4)));
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-gone", {restaurant_id + "-t"}, 18 * 60, 90)));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, restaurant_id + "-t", 4)));
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-dropped", {restaurant_id + "-t"}, 18 * 60, 90)));
    // destroyed without commit
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetBooking(*tx, restaurant_id + "-gone").has_value());
  assert(!repo.GetBooking(*tx, restaurant_id + "-dropped").has_value());
  assert(repo.ListTables(*tx, restaurant_id).empty());
  assert(repo.ListBookings(*tx, restaurant_id, kDate).empty());
  assert(!repo.GetRestaurant(*tx, restaurant_id).has_value());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& restaurant_id, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  const auto id = restaurant_id + "-contended";
  {
    auto tx = repo.Begin();
    SeedRestaurant(repo, *tx, restaurant_id);
    assert(repo.UpsertTable(*tx, MakeTable(restaurant_id, restaurant_id + "-t", 4)));
    assert(repo.InsertBooking(*tx, MakeBooking(restaurant_id, id, {restaurant_id + "-t"}, 18 * 60, 90)));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetBooking(*tx1, id);
  auto r2 = repo.GetBooking(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->notes   = "first writer";
  r1->version = 2;
  r2->notes   = "second writer";
  r2->version = 2;

  assert(repo.UpdateBooking(*tx1, *r1));
  tx1->Commit();

  // the loser fails either on the version check or at commit
  bool second_failed = false;
  try {
    auto result = repo.UpdateBooking(*tx2, *r2);
    if (!result) {
      second_failed = true;
      tx2->Rollback();
    } else {
      tx2->Commit();
    }
  } catch (const tablebook::util::StorageError& e) {
    assert(tablebook::db::IsTransient(e.code()));
    second_failed = true;
  }
  assert(second_failed);

  auto verify_tx = repo.BeginRead();
  auto final     = repo.GetBooking(*verify_tx, id);
  assert(final.has_value());
  assert(final->version == 2);
  assert(final->notes == "first writer");
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& restaurant_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    SeedRestaurant(*repo, *tx, restaurant_id);
    assert(repo->UpsertTable(*tx, MakeTable(restaurant_id, restaurant_id + "-t", 6)));
    assert(repo->InsertBooking(*tx, MakeBooking(restaurant_id, restaurant_id + "-kept", {restaurant_id + "-t"}, 19 * 60, 120)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->BeginRead();
  auto stored = repo->GetBooking(*tx, restaurant_id + "-kept");
  assert(stored.has_value());
  assert(stored->duration_minutes == 120);
  assert(stored->table_ids.size() == 1);
  assert(repo->ListTables(*tx, restaurant_id).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if TABLEBOOK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("tablebook_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<tablebook::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : tablebook::db::sql::SqliteSchema()) db->Exec(sql);
    return std::make_shared<tablebook::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if TABLEBOOK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TABLEBOOK_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TABLEBOOK_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<tablebook::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : tablebook::db::sql::PostgresSchema()) tx.exec(sql);
      tx.commit();
    }
    return std::make_shared<tablebook::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // ids are unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyCatalogReadWrite(*repo, run + "-catalog");
  VerifyBookingReadWrite(*repo, run + "-bookings");
  VerifyOverlappingClaimsRejected(*repo, run + "-overlap");
  VerifyOptimisticUpdates(*repo, run + "-versions");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TABLEBOOK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TABLEBOOK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tablebook_integration_repository_parity: pass\n";
  return 0;
}
