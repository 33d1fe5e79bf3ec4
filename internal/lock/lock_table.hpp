#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "lock.hpp"

namespace tablebook::lock {

/*
  In-process lock registry.

  TryAcquire has set-if-absent semantics; an expired entry counts as
  absent and is replaced. Release and Extend only succeed for the
  token that acquired the key.
*/
class LockTable {
 public:
  using Clock = std::chrono::steady_clock;

  std::optional<Lock> TryAcquire(const std::string& key, std::chrono::milliseconds ttl);

  bool Release(const std::string& key, const std::string& token);

  bool Extend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl);

  bool IsHeld(const std::string& key, const std::string& token);

  // Blocks until `key` is free, `deadline` passes, or `stop` is requested.
  void WaitForRelease(const std::string& key, Clock::time_point deadline, std::stop_token stop);

  std::size_t RemoveExpired();

  LockStats Stats();

 private:
  static bool IsExpired(const Lock& lock, Clock::time_point now);

  std::mutex                  mutex_;
  std::condition_variable_any released_;

  std::unordered_map<std::string, Lock> locks_;
};

} // namespace tablebook::lock
