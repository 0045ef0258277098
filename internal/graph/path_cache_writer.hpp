#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

#include "internal/db/api/repository.hpp"

namespace collab::graph {

/*
  Background writer for path cache rows.

  Path queries hand their results over and return immediately; a single
  thread persists them in its own transactions. Failures are logged and
  dropped, a lost write only costs a recomputation later.
*/
class PathCacheWriter {
 public:
  explicit PathCacheWriter(std::shared_ptr<db::Repository> repository);
  ~PathCacheWriter();

  PathCacheWriter(const PathCacheWriter&)            = delete;
  PathCacheWriter& operator=(const PathCacheWriter&) = delete;

  void Start();
  void Stop();

  void Enqueue(db::model::PathCacheRecord record);

  // Blocks until every record enqueued so far has been handled.
  void Flush();

  std::size_t Written() const;
  std::size_t Failed() const;

 private:
  void Run();
  void Write(const db::model::PathCacheRecord& record);

  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::condition_variable                idle_cv_;
  std::queue<db::model::PathCacheRecord> queue_;
  bool                                   shutdown_ = false;
  bool                                   busy_     = false;
  std::size_t                            written_  = 0;
  std::size_t                            failed_   = 0;

  std::thread thread_;
};

} // namespace collab::graph
