#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/aggregate_store.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/graph/trend_engine.hpp"

namespace collab::core {

// Optional restriction for TopCollaborators.
struct CollaboratorFilter {
  std::optional<model::CollaborationType> type;

  // role class the queried person played on the matching works
  std::optional<model::RoleKind> as_role;

  std::size_t  limit              = 10;
  std::int64_t min_collaborations = 1;

  bool Restricts() const {
    return type.has_value() || as_role.has_value();
  }
};

struct Collaborator {
  model::PersonId person_id           = 0;
  std::int64_t    collaboration_count = 0;

  // works passing the filter; equals collaboration_count when unfiltered
  std::int64_t          matching_works = 0;
  std::optional<double> avg_rating;
};

struct YearlyTrend {
  std::int32_t          year                 = 0;
  std::int64_t          unique_collaborators = 0;
  std::int64_t          new_collaborators    = 0;
  std::int64_t          works                = 0;
  std::optional<double> avg_rating;
  std::int64_t          total_revenue   = 0;
  std::int64_t          distinct_genres = 0;
};

// Spread of genre and role diversity over every pair.
struct DiversityStats {
  std::int64_t pairs               = 0;
  double       avg_genre_diversity = 0.0;
  double       avg_role_diversity  = 0.0;

  // pairs scoring above kHighDiversity
  std::int64_t high_genre_diversity = 0;
  std::int64_t high_role_diversity  = 0;
};

inline constexpr double kHighDiversity = 0.7;

// Pairs within this rating distance of the reference rank as similar.
inline constexpr double kSimilarRatingDelta = 0.5;

// Performer-director pairs need this many works to be offered as similar.
inline constexpr std::int64_t kSimilarMinCollaborations = 2;

struct GraphStats {
  db::model::GraphCounts counts;
  std::uint64_t          path_computations = 0;
  std::uint64_t          path_cache_hits   = 0;
};

struct CollaborationGraphOptions {
  std::int32_t  default_max_depth     = 6;
  std::uint32_t max_transient_retries = 5;
};

/*
  CollaborationGraph

  Query and population entrypoint of the subsystem. Reads go straight to the
  repository; writes are delegated to the aggregate store, path lookups to
  the path finder and ranking to the trend engine.

  Not-found is reported through std::optional or PathStatus; exceptions are
  util::InvalidArgument, util::AlreadyRunning and util::Unavailable.
*/
class CollaborationGraph {
 public:
  CollaborationGraph(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::AggregateStore> store,
                     std::shared_ptr<graph::PathFinder> path_finder, std::shared_ptr<graph::TrendEngine> trends,
                     CollaborationGraphOptions options = {});

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::optional<db::model::CollaborationRecord> PairStats(model::PersonId a, model::PersonId b);

  // nullopt for an unknown person
  std::optional<std::vector<Collaborator>> TopCollaborators(model::PersonId person, const CollaboratorFilter& filter);

  // max_depth falls back to the configured default
  graph::PathResult    ShortestPath(model::PersonId a, model::PersonId b, std::optional<std::int32_t> max_depth = std::nullopt);
  graph::PathWithWorks ShortestPathWithWorks(model::PersonId a, model::PersonId b, std::optional<std::int32_t> max_depth = std::nullopt);

  std::vector<db::model::TrendRecord> TopTrending(std::size_t limit);

  // most recent first
  std::vector<db::model::CollaborationDetailRecord> PairWorks(model::PersonId a, model::PersonId b,
                                                              std::optional<model::CollaborationType> type = std::nullopt);

  // newest year first; nullopt for an unknown person
  std::optional<std::vector<YearlyTrend>> PersonYearlyTrends(model::PersonId person);

  /*
    Other performer-director pairs with at least two works, the ones whose
    average rating lies within 0.5 of the reference pair's first, then by
    collaboration count. nullopt when the reference pair does not exist.
  */
  std::optional<std::vector<db::model::CollaborationRecord>> SimilarCollaborations(model::PersonId a, model::PersonId b,
                                                                                   std::size_t limit);

  DiversityStats Diversity();

  GraphStats Stats();

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  graph::ApplyReport        ApplyIncremental(model::WorkId work_id);
  graph::RebuildReport      RebuildAll();
  graph::TrendRefreshReport RefreshTrends();

 private:
  template <typename Fn>
  auto Read(const char* operation, Fn&& fn);

  std::int32_t ResolveDepth(std::optional<std::int32_t> max_depth) const;

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<graph::AggregateStore> store_;
  std::shared_ptr<graph::PathFinder>     path_finder_;
  std::shared_ptr<graph::TrendEngine>    trends_;
  CollaborationGraphOptions              options_;
};

} // namespace collab::core
