#include "lock_table.hpp"

#include <algorithm>

#include "internal/util/uuid.hpp"

namespace tablebook::lock {

bool LockTable::IsExpired(const Lock& lock, Clock::time_point now) {
  return lock.expires_at <= now;
}

std::optional<Lock> LockTable::TryAcquire(const std::string& key, std::chrono::milliseconds ttl) {
  std::lock_guard guard(mutex_);

  const auto now = Clock::now();
  if (auto it = locks_.find(key); it != locks_.end() && !IsExpired(it->second, now)) {
    return std::nullopt;
  }

  Lock lock{key, util::GenerateId(), now + ttl};
  locks_[key] = lock;
  return lock;
}

bool LockTable::Release(const std::string& key, const std::string& token) {
  {
    std::lock_guard guard(mutex_);

    auto it = locks_.find(key);
    if (it == locks_.end() || it->second.token != token) return false;
    locks_.erase(it);
  }
  released_.notify_all();
  return true;
}

bool LockTable::Extend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  std::lock_guard guard(mutex_);

  const auto now = Clock::now();
  auto       it  = locks_.find(key);
  if (it == locks_.end() || it->second.token != token || IsExpired(it->second, now)) return false;

  it->second.expires_at = now + ttl;
  return true;
}

bool LockTable::IsHeld(const std::string& key, const std::string& token) {
  std::lock_guard guard(mutex_);

  auto it = locks_.find(key);
  return it != locks_.end() && it->second.token == token && !IsExpired(it->second, Clock::now());
}

void LockTable::WaitForRelease(const std::string& key, Clock::time_point deadline, std::stop_token stop) {
  std::unique_lock guard(mutex_);

  // Wake no later than the holder's expiry; an expired key is free.
  if (auto it = locks_.find(key); it != locks_.end()) {
    deadline = std::min(deadline, it->second.expires_at);
  }

  released_.wait_until(guard, stop, deadline, [&] {
    auto it = locks_.find(key);
    return it == locks_.end() || IsExpired(it->second, Clock::now());
  });
}

std::size_t LockTable::RemoveExpired() {
  std::size_t removed = 0;
  {
    std::lock_guard guard(mutex_);

    const auto now = Clock::now();
    for (auto it = locks_.begin(); it != locks_.end();) {
      if (IsExpired(it->second, now)) {
        it = locks_.erase(it);
        ++removed;
        continue;
      }
      ++it;
    }
  }
  if (removed > 0) released_.notify_all();
  return removed;
}

LockStats LockTable::Stats() {
  std::lock_guard guard(mutex_);

  LockStats  stats;
  const auto now = Clock::now();
  stats.total    = locks_.size();
  for (const auto& [key, lock] : locks_) {
    if (IsExpired(lock, now)) {
      ++stats.expired;
    } else {
      ++stats.active;
    }
  }
  return stats;
}

} // namespace tablebook::lock
