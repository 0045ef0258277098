#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace collab::db {
class Repository;
}
namespace collab::graph {
class TrendEngine;
}

namespace collab::runtime {

struct MaintenanceOptions {
  std::chrono::milliseconds interval{std::chrono::hours(1)};
  std::chrono::milliseconds cache_ttl{std::chrono::hours(24 * 7)};
  util::ClockFn             clock = util::Now;
};

/*
  Background housekeeping.

  Every interval:
      refresh the trend snapshot
      delete path cache rows older than the TTL

  A refresh already in flight is logged and skipped; other failures are
  logged and retried on the next tick.
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::TrendEngine> trends, MaintenanceOptions options = {});
  ~MaintenanceWorker();

  MaintenanceWorker(const MaintenanceWorker&)            = delete;
  MaintenanceWorker& operator=(const MaintenanceWorker&) = delete;

  void Start();
  void Stop();

  // One maintenance pass on the calling thread.
  void RunOnce();

  std::uint64_t Passes() const;

 private:
  void Run();

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<graph::TrendEngine> trends_;
  MaintenanceOptions                  options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::uint64_t           passes_   = 0;
  std::thread             thread_;
};

} // namespace collab::runtime
