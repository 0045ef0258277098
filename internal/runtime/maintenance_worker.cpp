#include "maintenance_worker.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/graph/trend_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace collab::runtime {

using observability::IntField;
using observability::StringField;

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::TrendEngine> trends,
                                     MaintenanceOptions options)
    : repository_(std::move(repository)), trends_(std::move(trends)), options_(std::move(options)) {
  if (!repository_ || !trends_) {
    throw std::invalid_argument("MaintenanceWorker requires repository and trend engine");
  }
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::uint64_t MaintenanceWorker::Passes() const {
  std::lock_guard lock(mutex_);
  return passes_;
}

void MaintenanceWorker::RunOnce() {
  try {
    trends_->Refresh();
  } catch (const util::AlreadyRunning&) {
    COLLAB_LOG_INFO("trend refresh already running, skipping");
  } catch (const std::exception& e) {
    COLLAB_LOG_ERROR("trend refresh failed", {StringField("error", e.what())});
  }

  try {
    const auto now_ms = util::ToUnixMillis(options_.clock());
    const auto ttl_ms = static_cast<std::uint64_t>(options_.cache_ttl.count());
    const auto cutoff = now_ms > ttl_ms ? now_ms - ttl_ms : 0;

    auto       tx     = repository_->Begin();
    const auto result = repository_->DeleteExpiredPathCache(*tx, cutoff);
    if (result) {
      tx->Commit();
    } else {
      COLLAB_LOG_WARN("path cache purge failed", {StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    COLLAB_LOG_WARN("path cache purge failed", {StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  ++passes_;
}

void MaintenanceWorker::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, options_.interval, [&] { return stopping_; })) break;
    }
    RunOnce();
  }
  COLLAB_LOG_DEBUG("maintenance worker stopped", {IntField("passes", static_cast<std::int64_t>(Passes()))});
}

} // namespace collab::runtime
