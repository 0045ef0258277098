#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace collab::population {

using ApplyTask = std::function<void()>;

/*
  Thread-safe blocking queue for population workers.
*/
class ApplyScheduler {
 public:
  void Enqueue(ApplyTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<ApplyTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<ApplyTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace collab::population
