#include "apply_worker_pool.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace collab::population {

namespace {

// Completion state shared between one RunAll call and its tasks.
struct Batch {
  std::mutex              mutex;
  std::condition_variable done_cv;
  std::size_t             pending = 0;
  BatchResult             result;

  void Finish(bool ok) {
    {
      std::lock_guard lock(mutex);
      if (ok) {
        ++result.succeeded;
      } else {
        ++result.failed;
      }
      --pending;
    }
    done_cv.notify_all();
  }
};

} // namespace

ApplyWorkerPool::ApplyWorkerPool(std::size_t workers) : workers_(workers == 0 ? 1 : workers), scheduler_(std::make_shared<ApplyScheduler>()) {
}

ApplyWorkerPool::~ApplyWorkerPool() {
  Stop();
}

void ApplyWorkerPool::Start() {
  if (started_) return;
  started_ = true;
  threads_.reserve(workers_);
  for (std::size_t i = 0; i < workers_; ++i) {
    threads_.emplace_back(&ApplyWorkerPool::Run, this);
  }
}

void ApplyWorkerPool::Stop() {
  if (!started_) return;
  scheduler_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  started_ = false;
}

BatchResult ApplyWorkerPool::RunAll(const std::vector<model::WorkId>& work_ids, const std::function<void(model::WorkId)>& handler) {
  if (!started_) {
    throw std::runtime_error("apply worker pool not started");
  }

  auto batch     = std::make_shared<Batch>();
  batch->pending = work_ids.size();

  // tasks own the handler; queued ones outlive this call if Enqueue throws
  auto shared_handler = std::make_shared<const std::function<void(model::WorkId)>>(handler);

  for (const auto work_id : work_ids) {
    scheduler_->Enqueue([batch, work_id, shared_handler] {
      bool ok = true;
      try {
        (*shared_handler)(work_id);
      } catch (const std::exception& e) {
        ok = false;
        COLLAB_LOG_ERROR("work apply failed", {observability::IntField("work_id", work_id), observability::StringField("error", e.what())});
      } catch (...) {
        ok = false;
        COLLAB_LOG_ERROR("work apply failed", {observability::IntField("work_id", work_id), observability::StringField("error", "unknown exception")});
      }
      batch->Finish(ok);
    });
  }

  std::unique_lock lock(batch->mutex);
  batch->done_cv.wait(lock, [&] { return batch->pending == 0; });
  return batch->result;
}

void ApplyWorkerPool::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;
    (*task)();
  }
}

} // namespace collab::population
