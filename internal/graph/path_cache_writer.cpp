#include "internal/graph/path_cache_writer.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace collab::graph {

PathCacheWriter::PathCacheWriter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("PathCacheWriter requires a repository");
  }
}

PathCacheWriter::~PathCacheWriter() {
  Stop();
}

void PathCacheWriter::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  shutdown_ = false;
  thread_   = std::thread(&PathCacheWriter::Run, this);
}

void PathCacheWriter::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PathCacheWriter::Enqueue(db::model::PathCacheRecord record) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      COLLAB_LOG_WARN("path cache writer stopped, dropping entry", {observability::PairField("pair", record.pair)});
      return;
    }
    queue_.push(std::move(record));
  }
  cv_.notify_one();
}

void PathCacheWriter::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return (queue_.empty() && !busy_) || !thread_.joinable(); });
}

std::size_t PathCacheWriter::Written() const {
  std::lock_guard lock(mutex_);
  return written_;
}

std::size_t PathCacheWriter::Failed() const {
  std::lock_guard lock(mutex_);
  return failed_;
}

void PathCacheWriter::Run() {
  while (true) {
    db::model::PathCacheRecord record;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (shutdown_ && queue_.empty()) break;
      record = std::move(queue_.front());
      queue_.pop();
      busy_ = true;
    }

    Write(record);

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void PathCacheWriter::Write(const db::model::PathCacheRecord& record) {
  bool ok = false;
  try {
    auto       tx     = repository_->Begin();
    const auto result = repository_->UpsertPathCache(*tx, record);
    if (result) {
      tx->Commit();
      ok = true;
    } else {
      COLLAB_LOG_WARN("path cache write failed",
                      {observability::PairField("pair", record.pair), observability::StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    COLLAB_LOG_WARN("path cache write failed", {observability::PairField("pair", record.pair), observability::StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  if (ok) {
    ++written_;
  } else {
    ++failed_;
  }
}

} // namespace collab::graph
