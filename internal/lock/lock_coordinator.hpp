#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "lock.hpp"
#include "lock_key.hpp"
#include "lock_table.hpp"

namespace tablebook::runtime::config {
class LockConfig;
}

namespace tablebook::lock {

struct LockOptions {
  // Must exceed the worst-case validate + persist time.
  std::chrono::milliseconds ttl{10000};
  std::chrono::milliseconds max_wait{5000};
  std::chrono::milliseconds initial_backoff{25};
  std::chrono::milliseconds max_backoff{500};
  double                    backoff_multiplier = 2.0;
  uint32_t                  max_attempts       = 3;
  std::string               key_prefix{kDefaultKeyPrefix};
  std::chrono::milliseconds sweep_interval{1000};

  // Zero / empty fields keep the defaults above.
  static LockOptions FromConfig(const tablebook::runtime::config::LockConfig& config);
};

/*
  Set of locks held for one WithLock attempt.

  Released on destruction. The operation uses Remaining() to bound its
  storage work and EnsureHeld() right before committing.
*/
class LockLease {
 public:
  LockLease(LockTable& table, std::vector<Lock> locks);
  ~LockLease();

  LockLease(const LockLease&)            = delete;
  LockLease& operator=(const LockLease&) = delete;
  LockLease(LockLease&& other) noexcept;
  LockLease& operator=(LockLease&&) = delete;

  // Time left before the earliest of the held locks expires.
  std::chrono::milliseconds Remaining() const;

  // Throws LockExpired if any lock has lapsed or been taken over.
  void EnsureHeld() const;

  void Extend(std::chrono::milliseconds ttl);

  void Release() noexcept;

  const std::vector<Lock>& Locks() const {
    return locks_;
  }

 private:
  LockTable*        table_;
  std::vector<Lock> locks_;
};

// Closed classification over ErrorKind / db::ErrorCode. Lock contention
// and transient storage failures are retryable; everything else
// (schema and query defects, corruption, domain errors, unknown
// exceptions) is not.
bool IsNonRetryableError(const util::BookingError& error);
bool IsNonRetryableError(std::exception_ptr error);

/*
  Serializes booking mutations per lock key.

  WithLock acquires every key (sorted, so overlapping key sets cannot
  deadlock), waiting up to max_wait with exponential backoff, then runs
  `op`. Retryable failures release the keys, back off and run `op`
  again on fresh state, up to max_attempts. Non-retryable failures and
  the last retryable one are rethrown unchanged.
*/
class LockCoordinator {
 public:
  explicit LockCoordinator(LockOptions options = {});

  template <typename Fn>
  auto WithLock(std::vector<std::string> keys, Fn&& op, std::stop_token stop = {})
      -> std::invoke_result_t<Fn&, LockLease&>;

  template <typename Fn>
  auto WithLock(const std::string& key, Fn&& op, std::stop_token stop = {}) -> std::invoke_result_t<Fn&, LockLease&> {
    return WithLock(std::vector<std::string>{key}, std::forward<Fn>(op), std::move(stop));
  }

  std::string SlotKey(const std::string& restaurant_id, const std::string& date, const std::string& time) const;
  std::string TableKey(const std::string& restaurant_id, const std::string& table_id, const std::string& date) const;

  LockStats   Stats();
  std::size_t SweepExpired();

  const LockOptions& Options() const {
    return options_;
  }

  // Direct access for administrative tooling and tests.
  LockTable& Table() {
    return table_;
  }

 private:
  LockLease                 Acquire(std::vector<std::string> keys, std::stop_token stop);
  std::chrono::milliseconds Backoff(uint32_t attempt) const;
  void                      SleepFor(std::chrono::milliseconds delay, std::stop_token stop) const;

  LockOptions options_;
  LockTable   table_;
};

template <typename Fn>
auto LockCoordinator::WithLock(std::vector<std::string> keys, Fn&& op, std::stop_token stop)
    -> std::invoke_result_t<Fn&, LockLease&> {
  using R = std::invoke_result_t<Fn&, LockLease&>;

  for (uint32_t attempt = 1;; ++attempt) {
    LockLease lease = Acquire(keys, stop);

    try {
      if constexpr (std::is_void_v<R>) {
        op(lease);
        lease.Release();
        return;
      } else {
        R result = op(lease);
        lease.Release();
        return result;
      }
    } catch (...) {
      lease.Release();
      auto error = std::current_exception();

      if (IsNonRetryableError(error) || attempt >= options_.max_attempts || stop.stop_requested()) {
        observability::Metrics::Instance().RecordLockOutcome("failed");
        throw;
      }

      observability::Metrics::Instance().RecordLockOutcome("retried");
      TABLEBOOK_LOG_WARN("booking operation failed, retrying",
                         {observability::StringField("key", keys.front()), observability::IntField("attempt", attempt)});
      SleepFor(Backoff(attempt), stop);
    }
  }
}

} // namespace tablebook::lock
