#include "internal/lock/lock_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/lock/lock_sweeper.hpp"

namespace {

using tablebook::lock::IsNonRetryableError;
using tablebook::lock::LockCoordinator;
using tablebook::lock::LockLease;
using tablebook::lock::LockOptions;
using tablebook::lock::LockSweeper;
using namespace std::chrono_literals;

namespace util = tablebook::util;
namespace db   = tablebook::db;

LockOptions FastOptions() {
  LockOptions options;
  options.ttl             = 2s;
  options.max_wait        = 100ms;
  options.initial_backoff = 1ms;
  options.max_backoff     = 5ms;
  options.max_attempts    = 3;
  return options;
}

void TestWithLockReturnsValueAndReleases() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");

  const int value = locks.WithLock(key, [&](LockLease& lease) {
    lease.EnsureHeld();
    assert(lease.Remaining() > 0ms);
    assert(lease.Remaining() <= 2s);
    assert(locks.Stats().active == 1);
    return 42;
  });

  assert(value == 42);
  assert(locks.Stats().total == 0);
}

void TestMultipleKeysAreDedupedAndHeldTogether() {
  LockCoordinator locks(FastOptions());
  const auto      slot  = locks.SlotKey("bistro", "2030-06-14", "18:00");
  const auto      table = locks.TableKey("bistro", "t1", "2030-06-14");

  locks.WithLock(std::vector<std::string>{table, slot, table}, [&](LockLease& lease) {
    assert(lease.Locks().size() == 2);
    assert(locks.Stats().active == 2);
  });
  assert(locks.Stats().total == 0);
}

void TestHeldKeyTimesOutAsLockBusy() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");
  assert(locks.Table().TryAcquire(key, 30s));

  bool ran  = false;
  bool busy = false;
  try {
    locks.WithLock(key, [&](LockLease&) { ran = true; });
  } catch (const util::LockBusy&) {
    busy = true;
  }
  assert(busy);
  assert(!ran);
}

void TestPartialAcquireIsRolledBack() {
  LockCoordinator locks(FastOptions());
  const auto      a = locks.SlotKey("bistro", "2030-06-14", "18:00");
  const auto      b = locks.SlotKey("bistro", "2030-06-14", "18:30");
  assert(locks.Table().TryAcquire(b, 30s));

  bool busy = false;
  try {
    locks.WithLock(std::vector<std::string>{a, b}, [](LockLease&) {});
  } catch (const util::LockBusy&) {
    busy = true;
  }
  assert(busy);

  // the key taken before the busy one was given back
  assert(locks.Table().TryAcquire(a, 30s));
}

void TestExpiredHolderDoesNotBlock() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");
  assert(locks.Table().TryAcquire(key, 1ms));
  std::this_thread::sleep_for(5ms);

  assert(locks.WithLock(key, [](LockLease&) { return true; }));
}

void TestRetryableFailuresAreRetried() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");

  int attempts = 0;
  const auto result = locks.WithLock(key, [&](LockLease&) {
    if (++attempts < 3) throw util::StorageError(db::ErrorCode::Busy, "database is locked");
    return attempts;
  });
  assert(result == 3);

  attempts     = 0;
  bool expired = false;
  try {
    locks.WithLock(key, [&](LockLease&) {
      ++attempts;
      throw util::LockExpired("lease lapsed");
    });
  } catch (const util::LockExpired&) {
    expired = true;
  }
  assert(expired);
  assert(attempts == 3);
  assert(locks.Stats().total == 0);
}

void TestNonRetryableFailuresRunOnce() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");

  int  attempts = 0;
  bool conflict = false;
  try {
    locks.WithLock(key, [&](LockLease&) {
      ++attempts;
      throw util::CapacityConflict("no table");
    });
  } catch (const util::CapacityConflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(attempts == 1);

  attempts     = 0;
  bool storage = false;
  try {
    locks.WithLock(key, [&](LockLease&) {
      ++attempts;
      throw util::StorageError(db::ErrorCode::UndefinedTable, "no such table: bookings");
    });
  } catch (const util::StorageError& e) {
    storage = e.code() == db::ErrorCode::UndefinedTable;
  }
  assert(storage);
  assert(attempts == 1);
  assert(locks.Table().TryAcquire(key, 1s));
}

void TestClassification() {
  assert(!IsNonRetryableError(util::LockBusy("busy")));
  assert(!IsNonRetryableError(util::StorageError(db::ErrorCode::SerializationFailure, "retry")));
  assert(!IsNonRetryableError(util::StorageError(db::ErrorCode::ConstraintViolation, "overlap")));
  assert(IsNonRetryableError(util::StorageError(db::ErrorCode::Corruption, "bad page")));
  assert(IsNonRetryableError(util::InvalidArgument("bad date", "DATE_FORMAT")));
  assert(IsNonRetryableError(util::OverrideRequired("pacing full", 95.0)));
  assert(IsNonRetryableError(std::make_exception_ptr(std::runtime_error("boom"))));
  assert(IsNonRetryableError(std::exception_ptr{}));
}

void TestStopRequestCancelsWait() {
  LockCoordinator locks(FastOptions());
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");

  std::stop_source source;
  source.request_stop();

  bool cancelled = false;
  try {
    locks.WithLock(key, [](LockLease&) {}, source.get_token());
  } catch (const util::Cancelled&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(locks.Stats().total == 0);
}

void TestSameKeyIsMutuallyExclusive() {
  auto options     = FastOptions();
  options.max_wait = 10s;
  LockCoordinator locks(options);
  const auto      key = locks.SlotKey("bistro", "2030-06-14", "18:00");

  std::atomic<int> inside{0};
  std::atomic<int> overlap{0};
  int              counter = 0;

  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      for (int j = 0; j < 25; ++j) {
        locks.WithLock(key, [&](LockLease&) {
          if (inside.fetch_add(1) != 0) overlap.fetch_add(1);
          ++counter;
          inside.fetch_sub(1);
        });
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(overlap.load() == 0);
  assert(counter == 200);
}

void TestOptionsFromConfig() {
  tablebook::runtime::config::LockConfig config;
  config.set_ttl_ms(3000);
  config.set_max_attempts(5);
  config.set_key_prefix("tb:");

  const auto options = LockOptions::FromConfig(config);
  assert(options.ttl == 3000ms);
  assert(options.max_attempts == 5);
  assert(options.key_prefix == "tb:");
  assert(options.max_wait == LockOptions{}.max_wait);
  assert(options.backoff_multiplier == LockOptions{}.backoff_multiplier);

  LockCoordinator locks(options);
  assert(locks.SlotKey("bistro", "2030-06-14", "18:00").rfind("tb:", 0) == 0);
}

void TestSweeperPurgesExpiredEntries() {
  auto locks = std::make_shared<LockCoordinator>(FastOptions());
  assert(locks->Table().TryAcquire("stale-1", 1ms));
  assert(locks->Table().TryAcquire("stale-2", 1ms));
  assert(locks->Table().TryAcquire("live", 30s));

  LockSweeper sweeper(locks, 5ms);
  sweeper.Start();

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (locks->Stats().total != 1 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  sweeper.Stop();

  const auto stats = locks->Stats();
  assert(stats.total == 1);
  assert(stats.active == 1);
}

} // namespace

int main() {
  TestWithLockReturnsValueAndReleases();
  TestMultipleKeysAreDedupedAndHeldTogether();
  TestHeldKeyTimesOutAsLockBusy();
  TestPartialAcquireIsRolledBack();
  TestExpiredHolderDoesNotBlock();
  TestRetryableFailuresAreRetried();
  TestNonRetryableFailuresRunOnce();
  TestClassification();
  TestStopRequestCancelsWait();
  TestSameKeyIsMutuallyExclusive();
  TestOptionsFromConfig();
  TestSweeperPurgesExpiredEntries();

  std::cout << "tablebook_unit_lock_coordinator: pass\n";
  return 0;
}
