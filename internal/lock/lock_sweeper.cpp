#include "lock_sweeper.hpp"

#include "internal/observability/logging.hpp"

namespace tablebook::lock {

LockSweeper::LockSweeper(std::shared_ptr<LockCoordinator> coordinator, std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)) {}

LockSweeper::~LockSweeper() {
  Stop();
}

void LockSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LockSweeper::Loop, this);
}

void LockSweeper::Stop() {
  {
    std::lock_guard guard(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LockSweeper::Loop() {
  while (running_) {
    {
      std::unique_lock guard(mutex_);
      if (wake_.wait_for(guard, interval_, [this] { return !running_; })) break;
    }

    const auto removed = coordinator_->SweepExpired();
    if (removed > 0) {
      TABLEBOOK_LOG_INFO("swept expired booking locks", {observability::IntField("removed", static_cast<int64_t>(removed))});
    }
  }
}

} // namespace tablebook::lock
