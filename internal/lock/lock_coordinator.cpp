#include "lock_coordinator.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <random>

#include "config/config.pb.h"

namespace tablebook::lock {

LockOptions LockOptions::FromConfig(const tablebook::runtime::config::LockConfig& config) {
  LockOptions options;
  if (config.ttl_ms() > 0) options.ttl = std::chrono::milliseconds(config.ttl_ms());
  if (config.max_wait_ms() > 0) options.max_wait = std::chrono::milliseconds(config.max_wait_ms());
  if (config.initial_backoff_ms() > 0) options.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  if (config.max_backoff_ms() > 0) options.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  if (config.backoff_multiplier() >= 1.0) options.backoff_multiplier = config.backoff_multiplier();
  if (config.max_attempts() > 0) options.max_attempts = config.max_attempts();
  if (!config.key_prefix().empty()) options.key_prefix = config.key_prefix();
  if (config.sweep_interval_ms() > 0) options.sweep_interval = std::chrono::milliseconds(config.sweep_interval_ms());
  return options;
}

// ------------------------------------------------------------------
// LockLease
// ------------------------------------------------------------------

LockLease::LockLease(LockTable& table, std::vector<Lock> locks) : table_(&table), locks_(std::move(locks)) {
}

LockLease::~LockLease() {
  Release();
}

LockLease::LockLease(LockLease&& other) noexcept : table_(other.table_), locks_(std::move(other.locks_)) {
  other.locks_.clear();
}

std::chrono::milliseconds LockLease::Remaining() const {
  if (locks_.empty()) return std::chrono::milliseconds(0);

  auto earliest = locks_.front().expires_at;
  for (const auto& lock : locks_) earliest = std::min(earliest, lock.expires_at);

  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - LockTable::Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

void LockLease::EnsureHeld() const {
  if (locks_.empty()) {
    throw util::LockExpired("booking lock already released");
  }
  for (const auto& lock : locks_) {
    if (!table_->IsHeld(lock.key, lock.token)) {
      throw util::LockExpired("booking lock expired: " + lock.key);
    }
  }
}

void LockLease::Extend(std::chrono::milliseconds ttl) {
  for (auto& lock : locks_) {
    if (!table_->Extend(lock.key, lock.token, ttl)) {
      throw util::LockExpired("booking lock expired: " + lock.key);
    }
    lock.expires_at = LockTable::Clock::now() + ttl;
  }
}

void LockLease::Release() noexcept {
  for (const auto& lock : locks_) table_->Release(lock.key, lock.token);
  locks_.clear();
}

// ------------------------------------------------------------------
// Classification
// ------------------------------------------------------------------

bool IsNonRetryableError(const util::BookingError& error) {
  switch (error.kind()) {
    case util::ErrorKind::kLockBusy:
    case util::ErrorKind::kLockExpired:
      return false;
    case util::ErrorKind::kStorage:
      return !db::IsTransient(static_cast<const util::StorageError&>(error).code());
    case util::ErrorKind::kInvalidArgument:
    case util::ErrorKind::kNotFound:
    case util::ErrorKind::kAlreadyExists:
    case util::ErrorKind::kInvalidState:
    case util::ErrorKind::kRestaurantClosed:
    case util::ErrorKind::kCapacityConflict:
    case util::ErrorKind::kOverrideRequired:
    case util::ErrorKind::kCancelled:
      return true;
  }
  return true;
}

bool IsNonRetryableError(std::exception_ptr error) {
  if (!error) return true;

  try {
    std::rethrow_exception(error);
  } catch (const util::BookingError& e) {
    return IsNonRetryableError(e);
  } catch (const std::exception&) {
    return true;
  } catch (...) {
    return true;
  }
}

// ------------------------------------------------------------------
// LockCoordinator
// ------------------------------------------------------------------

LockCoordinator::LockCoordinator(LockOptions options) : options_(std::move(options)) {
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

std::string LockCoordinator::SlotKey(const std::string& restaurant_id, const std::string& date,
                                     const std::string& time) const {
  return SlotLockKey(options_.key_prefix, restaurant_id, date, time);
}

std::string LockCoordinator::TableKey(const std::string& restaurant_id, const std::string& table_id,
                                      const std::string& date) const {
  return TableLockKey(options_.key_prefix, restaurant_id, table_id, date);
}

LockStats LockCoordinator::Stats() {
  return table_.Stats();
}

std::size_t LockCoordinator::SweepExpired() {
  return table_.RemoveExpired();
}

std::chrono::milliseconds LockCoordinator::Backoff(uint32_t attempt) const {
  thread_local std::mt19937_64 rng{std::random_device{}()};

  const double base   = static_cast<double>(options_.initial_backoff.count()) *
                      std::pow(options_.backoff_multiplier, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
  const double capped = std::min(base, static_cast<double>(options_.max_backoff.count()));

  // jitter in [capped/2, capped]
  std::uniform_real_distribution<double> jitter(capped / 2.0, capped);
  return std::chrono::milliseconds(std::max<int64_t>(1, static_cast<int64_t>(jitter(rng))));
}

void LockCoordinator::SleepFor(std::chrono::milliseconds delay, std::stop_token stop) const {
  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            guard(mutex);
  cv.wait_for(guard, stop, delay, [] { return false; });
}

LockLease LockCoordinator::Acquire(std::vector<std::string> keys, std::stop_token stop) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  observability::SpanScope span("booking.lock.acquire");
  span.SetAttribute("lock.keys", static_cast<std::int64_t>(keys.size()));

  const auto started  = LockTable::Clock::now();
  const auto deadline = started + options_.max_wait;
  auto&      metrics  = observability::Metrics::Instance();

  auto observe_wait = [&] {
    metrics.ObserveLockWaitMs(std::chrono::duration<double, std::milli>(LockTable::Clock::now() - started).count());
  };

  std::vector<Lock> held;
  for (const auto& key : keys) {
    for (uint32_t attempt = 1;; ++attempt) {
      if (stop.stop_requested()) {
        LockLease(table_, std::move(held)).Release();
        observe_wait();
        metrics.RecordLockOutcome("cancelled");
        throw util::Cancelled("booking lock wait cancelled: " + key);
      }

      if (auto lock = table_.TryAcquire(key, options_.ttl)) {
        held.push_back(std::move(*lock));
        break;
      }

      const auto now = LockTable::Clock::now();
      if (now >= deadline) {
        LockLease(table_, std::move(held)).Release();
        observe_wait();
        metrics.RecordLockOutcome("busy");
        span.RecordException("lock busy: " + key);
        TABLEBOOK_LOG_WARN("booking lock busy",
                           {observability::StringField("key", key),
                            observability::IntField("waited_ms", options_.max_wait.count())});
        throw util::LockBusy("booking lock busy, try again: " + key);
      }

      if (attempt > 1) {
        TABLEBOOK_LOG_DEBUG("waiting for booking lock",
                            {observability::StringField("key", key), observability::IntField("attempt", attempt)});
      }
      table_.WaitForRelease(key, std::min(deadline, now + Backoff(attempt)), stop);
    }
  }

  observe_wait();
  metrics.RecordLockOutcome("acquired");
  return LockLease(table_, std::move(held));
}

} // namespace tablebook::lock
