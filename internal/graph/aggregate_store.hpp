#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/edge_builder.hpp"
#include "internal/util/single_flight.hpp"
#include "internal/util/time.hpp"

namespace collab::population {
class ApplyWorkerPool;
}

namespace collab::graph {

struct ApplyReport {
  model::WorkId work_id = 0;
  BuildReport   build;

  std::int64_t details_inserted  = 0;
  std::int64_t details_updated   = 0;
  std::int64_t details_unchanged = 0;

  // transaction attempts including the successful one
  std::int32_t attempts = 0;
};

struct RebuildReport {
  std::uint64_t works_applied = 0;
  std::uint64_t works_failed  = 0;
  std::uint64_t pairs         = 0;
  double        duration_ms   = 0.0;
};

struct AggregateStoreOptions {
  // Busy / IOError retries before giving up; conflicts are not bounded.
  std::uint32_t max_transient_retries = 5;
  util::ClockFn clock                 = util::Now;
};

/*
  AggregateStore

  Owns the pair table and the per-work detail table and merges edge builder
  output into them.

  Guarantees:
    - applying a work twice changes nothing the second time
    - every pair row is recomputed from its full detail set, so rebuild and
      any order of incremental applies converge
    - pairs are locked in canonical order inside one transaction
*/
class AggregateStore {
 public:
  AggregateStore(std::shared_ptr<db::Repository> repository, EdgeBuilder builder, AggregateStoreOptions options = {},
                 std::shared_ptr<population::ApplyWorkerPool> pool = nullptr);

  // Applies already built candidates for one work.
  ApplyReport Apply(const db::model::WorkRecord& work, const BuildOutput& build);

  // Reads the work and its credits, builds candidates and applies them.
  // Throws util::InvalidArgument for an unknown work.
  ApplyReport ApplyIncremental(model::WorkId work_id);

  // Single-flight; throws util::AlreadyRunning when a rebuild is in progress.
  RebuildReport RebuildAll();

  bool RebuildInProgress() const {
    return rebuild_flight_.Running();
  }

 private:
  // Applies inside an open transaction; does not commit.
  void ApplyInTx(db::Transaction& tx, const db::model::WorkRecord& work, const BuildOutput& build, ApplyReport& report);

  std::shared_ptr<db::Repository>              repository_;
  EdgeBuilder                                  builder_;
  AggregateStoreOptions                        options_;
  std::shared_ptr<population::ApplyWorkerPool> pool_;

  util::SingleFlight rebuild_flight_;
};

} // namespace collab::graph
