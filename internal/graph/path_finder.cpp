#include "internal/graph/path_finder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/graph/path_cache_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace collab::graph {

using model::PersonId;
using observability::IntField;
using observability::PairField;
using observability::StringField;

namespace {

std::vector<PersonId> Oriented(const db::model::PathCacheRecord& record, PersonId from) {
  auto path = record.path;
  if (from != record.pair.low) {
    std::reverse(path.begin(), path.end());
  }
  return path;
}

PathResult Found(std::vector<PersonId> path, bool from_cache) {
  PathResult result;
  result.status     = PathStatus::kFound;
  result.length     = static_cast<std::int32_t>(path.size()) - 1;
  result.path       = std::move(path);
  result.from_cache = from_cache;
  return result;
}

PathResult Status(PathStatus status, bool from_cache = false) {
  PathResult result;
  result.status     = status;
  result.from_cache = from_cache;
  return result;
}

} // namespace

PathFinder::PathFinder(std::shared_ptr<db::Repository> repository, std::shared_ptr<PathCacheWriter> cache_writer, PathFinderOptions options)
    : repository_(std::move(repository)), cache_writer_(std::move(cache_writer)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("PathFinder requires a repository");
  }
}

// Runs in its own transaction: a failed statement can poison the transaction
// it ran in (Postgres aborts it), and the search must not inherit that.
std::optional<db::model::PathCacheRecord> PathFinder::ReadCache(const model::PersonPair& pair) {
  try {
    auto tx     = repository_->Begin();
    auto cached = repository_->GetPathCache(*tx, pair);
    tx->Commit();
    if (!cached) return std::nullopt;

    const auto now_ms = util::ToUnixMillis(options_.clock());
    const auto ttl_ms = static_cast<std::uint64_t>(options_.cache_ttl.count());
    if (now_ms > cached->computed_at_ms && now_ms - cached->computed_at_ms >= ttl_ms) {
      return std::nullopt;
    }
    return cached;
  } catch (const std::exception& e) {
    COLLAB_LOG_WARN("path cache read failed", {PairField("pair", pair), StringField("error", e.what())});
    return std::nullopt;
  }
}

void PathFinder::WriteCache(db::model::PathCacheRecord record) {
  if (cache_writer_) {
    cache_writer_->Enqueue(std::move(record));
    return;
  }

  // no background writer configured: write inline in a separate transaction
  try {
    auto       tx     = repository_->Begin();
    const auto result = repository_->UpsertPathCache(*tx, record);
    if (!result) {
      COLLAB_LOG_WARN("path cache write failed", {PairField("pair", record.pair), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    COLLAB_LOG_WARN("path cache write failed", {PairField("pair", record.pair), StringField("error", e.what())});
  }
}

std::vector<PersonId> PathFinder::Search(db::Transaction& tx, PersonId a, PersonId b, std::int32_t max_depth) {
  std::unordered_map<PersonId, PersonId> parent;
  parent.emplace(a, a);

  std::vector<PersonId> frontier{a};
  bool                  found = false;

  for (std::int32_t depth = 1; depth <= max_depth && !frontier.empty() && !found; ++depth) {
    const auto neighbors = repository_->ListNeighbors(tx, frontier);

    std::vector<PersonId> next;
    for (const auto node : frontier) {
      const auto it = neighbors.find(node);
      if (it == neighbors.end()) continue;

      for (const auto neighbor : it->second) {
        if (!parent.emplace(neighbor, node).second) continue;
        if (neighbor == b) {
          found = true;
          break;
        }
        next.push_back(neighbor);
      }
      if (found) break;
    }

    std::sort(next.begin(), next.end());
    frontier = std::move(next);
  }

  if (!found) return {};

  std::vector<PersonId> path;
  for (PersonId node = b; node != a; node = parent.at(node)) {
    path.push_back(node);
  }
  path.push_back(a);
  std::reverse(path.begin(), path.end());
  return path;
}

PathResult PathFinder::ShortestPath(PersonId a, PersonId b, std::int32_t max_depth) {
  if (max_depth <= 0) {
    throw util::InvalidArgument("max_depth must be positive, got " + std::to_string(max_depth));
  }

  observability::SpanScope span("graph.shortest_path");
  span.SetAttribute("max_depth", static_cast<std::int64_t>(max_depth));

  {
    auto       tx    = repository_->Begin();
    const bool known = repository_->PersonExists(*tx, a) && (a == b || repository_->PersonExists(*tx, b));
    tx->Commit();
    if (!known) return Status(PathStatus::kUnknownPerson);
  }

  if (a == b) {
    return Found({a}, false);
  }

  const auto pair = model::PersonPair::Canonical(a, b);

  if (const auto cached = ReadCache(pair)) {
    cache_hits_.fetch_add(1);
    observability::Metrics::Instance().RecordPathLookup(true);
    if (cached->path_length > max_depth) {
      return Status(PathStatus::kNoPathWithinDepth, true);
    }
    return Found(Oriented(*cached, a), true);
  }

  computations_.fetch_add(1);
  observability::Metrics::Instance().RecordPathLookup(false);

  std::vector<PersonId> path;
  {
    auto tx = repository_->Begin();
    path    = Search(*tx, a, b, max_depth);
    tx->Commit();
  }

  if (path.empty()) {
    COLLAB_LOG_DEBUG("no path within depth", {PairField("pair", pair), IntField("max_depth", max_depth)});
    return Status(PathStatus::kNoPathWithinDepth);
  }

  db::model::PathCacheRecord record;
  record.pair           = pair;
  record.path           = path;
  record.path_length    = static_cast<std::int32_t>(path.size()) - 1;
  record.computed_at_ms = util::ToUnixMillis(options_.clock());
  if (a != pair.low) {
    std::reverse(record.path.begin(), record.path.end());
  }
  WriteCache(std::move(record));

  return Found(std::move(path), false);
}

PathWithWorks PathFinder::ShortestPathWithWorks(PersonId a, PersonId b, std::int32_t max_depth) {
  PathWithWorks out;
  out.result = ShortestPath(a, b, max_depth);
  if (!out.result.Found() || out.result.path.size() < 2) {
    return out;
  }

  auto tx = repository_->Begin();
  for (std::size_t i = 0; i + 1 < out.result.path.size(); ++i) {
    PathHop hop;
    hop.from = out.result.path[i];
    hop.to   = out.result.path[i + 1];

    // details come ordered by work id, so strict > keeps the lowest id per year
    bool chosen = false;
    for (const auto& detail : repository_->ListDetailsForPair(*tx, model::PersonPair::Canonical(hop.from, hop.to))) {
      if (!chosen || detail.year > hop.release_year) {
        hop.work_id      = detail.work_id;
        hop.release_year = detail.year;
        chosen           = true;
      }
    }
    out.hops.push_back(hop);
  }
  tx->Commit();
  return out;
}

} // namespace collab::graph
