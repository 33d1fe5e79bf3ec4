#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "lock_coordinator.hpp"

namespace tablebook::lock {

/*
  Background worker that purges expired lock entries.

  Expired entries are already treated as free by TryAcquire; sweeping
  keeps the registry and its stats from accumulating keys of crashed
  holders.
*/
class LockSweeper {
 public:
  LockSweeper(std::shared_ptr<LockCoordinator> coordinator, std::chrono::milliseconds interval);
  ~LockSweeper();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<LockCoordinator> coordinator_;
  std::chrono::milliseconds        interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace tablebook::lock
