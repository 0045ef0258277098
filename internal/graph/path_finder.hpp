#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace collab::graph {

class PathCacheWriter;

enum class PathStatus {
  kFound,
  kNoPathWithinDepth,
  kUnknownPerson,
};

struct PathResult {
  PathStatus status = PathStatus::kNoPathWithinDepth;

  // a .. b inclusive; empty unless found
  std::vector<model::PersonId> path;
  std::int32_t                 length     = 0;
  bool                         from_cache = false;

  bool Found() const {
    return status == PathStatus::kFound;
  }
};

// One edge of a path with the work that connects its two people.
struct PathHop {
  model::PersonId from         = 0;
  model::PersonId to           = 0;
  model::WorkId   work_id      = 0;
  std::int32_t    release_year = 0;
};

struct PathWithWorks {
  PathResult           result;
  std::vector<PathHop> hops;
};

struct PathFinderOptions {
  std::chrono::milliseconds cache_ttl{std::chrono::hours(24 * 7)};
  util::ClockFn             clock = util::Now;
};

/*
  PathFinder

  Bounded breadth-first search over the collaboration pair adjacency with a
  TTL cache keyed by the unordered person pair.

  Each BFS level is a single ListNeighbors round-trip. Cache entries are
  never invalidated by edge changes; staleness is bounded by the TTL.

  Cache read/write failures degrade to a recomputation and never fail the
  query.
*/
class PathFinder {
 public:
  PathFinder(std::shared_ptr<db::Repository> repository, std::shared_ptr<PathCacheWriter> cache_writer, PathFinderOptions options = {});

  // max_depth <= 0 throws util::InvalidArgument
  PathResult ShortestPath(model::PersonId a, model::PersonId b, std::int32_t max_depth);

  // Path plus, per hop, the most recent shared work (lowest id on ties).
  PathWithWorks ShortestPathWithWorks(model::PersonId a, model::PersonId b, std::int32_t max_depth);

  // BFS runs since construction
  std::uint64_t Computations() const {
    return computations_.load();
  }

  std::uint64_t CacheHits() const {
    return cache_hits_.load();
  }

 private:
  std::optional<db::model::PathCacheRecord> ReadCache(const model::PersonPair& pair);
  void                                      WriteCache(db::model::PathCacheRecord record);

  std::vector<model::PersonId> Search(db::Transaction& tx, model::PersonId a, model::PersonId b, std::int32_t max_depth);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<PathCacheWriter> cache_writer_;
  PathFinderOptions                options_;

  std::atomic<std::uint64_t> computations_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
};

} // namespace collab::graph
