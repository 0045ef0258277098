#include "memory_tx.hpp"

#include "internal/db/api/result.hpp"

namespace collab::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_); // copy on first write
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw DbError(ErrorCode::InternalError, "transaction already finished");
  }
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw DbError(ErrorCode::Conflict, "transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::make_shared<const MemoryRepository::State>(std::move(*working_));
  repo_.committed_version_++;
  working_.reset();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace collab::db::memory
