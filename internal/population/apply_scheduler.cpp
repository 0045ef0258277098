#include "apply_scheduler.hpp"

#include <stdexcept>
#include <utility>

namespace collab::population {

void ApplyScheduler::Enqueue(ApplyTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("apply scheduler is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<ApplyTask> ApplyScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ApplyTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void ApplyScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace collab::population
