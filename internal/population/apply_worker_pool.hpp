#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "apply_scheduler.hpp"
#include "internal/model/person_pair.hpp"

namespace collab::population {

struct BatchResult {
  std::uint64_t succeeded = 0;
  std::uint64_t failed    = 0;
};

/*
  Fixed set of threads applying works in parallel.

  RunAll blocks the caller until every item of the batch has been handled.
  A handler that throws counts as a failure and never stops the batch.
*/
class ApplyWorkerPool {
 public:
  explicit ApplyWorkerPool(std::size_t workers);
  ~ApplyWorkerPool();

  ApplyWorkerPool(const ApplyWorkerPool&)            = delete;
  ApplyWorkerPool& operator=(const ApplyWorkerPool&) = delete;

  void Start();
  void Stop();

  std::size_t Size() const {
    return workers_;
  }

  BatchResult RunAll(const std::vector<model::WorkId>& work_ids, const std::function<void(model::WorkId)>& handler);

 private:
  void Run();

  std::size_t                     workers_;
  std::shared_ptr<ApplyScheduler> scheduler_;
  std::vector<std::thread>        threads_;
  bool                            started_ = false;
};

} // namespace collab::population
