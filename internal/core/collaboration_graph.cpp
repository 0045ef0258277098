#include "collaboration_graph.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/graph/retry.hpp"
#include "internal/util/errors.hpp"

namespace collab::core {

using model::PersonId;

namespace {

model::PersonPair PairOf(PersonId a, PersonId b) {
  if (a == b) {
    throw util::InvalidArgument("pair requires two distinct people, got " + std::to_string(a) + " twice");
  }
  return model::PersonPair::Canonical(a, b);
}

bool Matches(const db::model::CollaborationDetailRecord& detail, PersonId person, const CollaboratorFilter& filter) {
  if (filter.type && detail.type != *filter.type) return false;
  if (filter.as_role && detail.RoleOf(person) != *filter.as_role) return false;
  return true;
}

// matching works desc, count desc, avg rating desc (absent last), id asc
bool RanksBefore(const Collaborator& a, const Collaborator& b) {
  if (a.matching_works != b.matching_works) return a.matching_works > b.matching_works;
  if (a.collaboration_count != b.collaboration_count) return a.collaboration_count > b.collaboration_count;
  if (a.avg_rating.has_value() != b.avg_rating.has_value()) return a.avg_rating.has_value();
  if (a.avg_rating && *a.avg_rating != *b.avg_rating) return *a.avg_rating > *b.avg_rating;
  return a.person_id < b.person_id;
}

// absent ratings on either side never count as close
bool RatingClose(const std::optional<double>& a, const std::optional<double>& b) {
  return a && b && std::abs(*a - *b) < kSimilarRatingDelta;
}

} // namespace

CollaborationGraph::CollaborationGraph(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::AggregateStore> store,
                                       std::shared_ptr<graph::PathFinder> path_finder, std::shared_ptr<graph::TrendEngine> trends,
                                       CollaborationGraphOptions options)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      path_finder_(std::move(path_finder)),
      trends_(std::move(trends)),
      options_(options) {
  if (!repository_ || !store_ || !path_finder_ || !trends_) {
    throw std::invalid_argument("CollaborationGraph requires repository, store, path finder and trend engine");
  }
}

template <typename Fn>
auto CollaborationGraph::Read(const char* operation, Fn&& fn) {
  return graph::RunWithRetries(operation, options_.max_transient_retries, [&](std::int32_t) {
    auto tx     = repository_->Begin();
    auto result = fn(*tx);
    tx->Commit();
    return result;
  });
}

std::int32_t CollaborationGraph::ResolveDepth(std::optional<std::int32_t> max_depth) const {
  return max_depth.value_or(options_.default_max_depth);
}

std::optional<db::model::CollaborationRecord> CollaborationGraph::PairStats(PersonId a, PersonId b) {
  const auto pair = PairOf(a, b);
  return Read("pair_stats", [&](db::Transaction& tx) { return repository_->GetCollaboration(tx, pair); });
}

std::optional<std::vector<Collaborator>> CollaborationGraph::TopCollaborators(PersonId person, const CollaboratorFilter& filter) {
  if (filter.limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }

  return Read("top_collaborators", [&](db::Transaction& tx) -> std::optional<std::vector<Collaborator>> {
    if (!repository_->PersonExists(tx, person)) return std::nullopt;

    std::vector<Collaborator> ranked;
    const auto                pairs = repository_->ListCollaborationsForPerson(tx, person);

    // per-pair detail counts are only needed when filtering
    std::map<PersonId, std::int64_t> matching;
    if (filter.Restricts()) {
      for (const auto& detail : repository_->ListDetailsForPerson(tx, person)) {
        if (Matches(detail, person, filter)) ++matching[detail.pair.Other(person)];
      }
    }

    for (const auto& pair : pairs) {
      Collaborator entry;
      entry.person_id           = pair.pair.Other(person);
      entry.collaboration_count = pair.collaboration_count;
      entry.avg_rating          = pair.avg_rating;
      if (filter.Restricts()) {
        const auto it        = matching.find(entry.person_id);
        entry.matching_works = it == matching.end() ? 0 : it->second;
        if (entry.matching_works == 0) continue;
      } else {
        entry.matching_works = pair.collaboration_count;
      }
      if (entry.matching_works < filter.min_collaborations) continue;
      ranked.push_back(entry);
    }

    std::sort(ranked.begin(), ranked.end(), RanksBefore);
    if (ranked.size() > filter.limit) ranked.resize(filter.limit);
    return ranked;
  });
}

graph::PathResult CollaborationGraph::ShortestPath(PersonId a, PersonId b, std::optional<std::int32_t> max_depth) {
  return graph::RunWithRetries("shortest_path", options_.max_transient_retries,
                               [&](std::int32_t) { return path_finder_->ShortestPath(a, b, ResolveDepth(max_depth)); });
}

graph::PathWithWorks CollaborationGraph::ShortestPathWithWorks(PersonId a, PersonId b, std::optional<std::int32_t> max_depth) {
  return graph::RunWithRetries("shortest_path_with_works", options_.max_transient_retries,
                               [&](std::int32_t) { return path_finder_->ShortestPathWithWorks(a, b, ResolveDepth(max_depth)); });
}

std::vector<db::model::TrendRecord> CollaborationGraph::TopTrending(std::size_t limit) {
  if (limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }
  return trends_->TopTrending(limit);
}

std::vector<db::model::CollaborationDetailRecord> CollaborationGraph::PairWorks(PersonId a, PersonId b,
                                                                                std::optional<model::CollaborationType> type) {
  const auto pair = PairOf(a, b);

  auto details = Read("pair_works", [&](db::Transaction& tx) { return repository_->ListDetailsForPair(tx, pair); });
  if (type) {
    details.erase(std::remove_if(details.begin(), details.end(), [&](const auto& d) { return d.type != *type; }), details.end());
  }
  std::stable_sort(details.begin(), details.end(), [](const auto& x, const auto& y) { return x.year > y.year; });
  return details;
}

std::optional<std::vector<db::model::CollaborationRecord>> CollaborationGraph::SimilarCollaborations(PersonId a, PersonId b,
                                                                                                   std::size_t limit) {
  const auto pair = PairOf(a, b);
  if (limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }

  return Read("similar_collaborations", [&](db::Transaction& tx) -> std::optional<std::vector<db::model::CollaborationRecord>> {
    const auto reference = repository_->GetCollaboration(tx, pair);
    if (!reference) return std::nullopt;

    std::vector<db::model::CollaborationRecord> similar;
    for (auto& candidate : repository_->ListAllCollaborations(tx)) {
      if (candidate.pair == pair) continue;
      if (!candidate.types.Contains(model::CollaborationType::kPerformerDirector)) continue;
      if (candidate.collaboration_count < kSimilarMinCollaborations) continue;
      similar.push_back(std::move(candidate));
    }

    // input is in canonical pair order, so stable_sort keeps it as the last key
    std::stable_sort(similar.begin(), similar.end(), [&](const auto& x, const auto& y) {
      const bool x_close = RatingClose(x.avg_rating, reference->avg_rating);
      const bool y_close = RatingClose(y.avg_rating, reference->avg_rating);
      if (x_close != y_close) return x_close;
      return x.collaboration_count > y.collaboration_count;
    });
    if (similar.size() > limit) similar.resize(limit);
    return similar;
  });
}

DiversityStats CollaborationGraph::Diversity() {
  return Read("diversity_stats", [&](db::Transaction& tx) {
    DiversityStats stats;
    double         genre_sum = 0.0;
    double         role_sum  = 0.0;
    for (const auto& pair : repository_->ListAllCollaborations(tx)) {
      ++stats.pairs;
      genre_sum += pair.genre_diversity;
      role_sum += pair.role_diversity;
      if (pair.genre_diversity > kHighDiversity) ++stats.high_genre_diversity;
      if (pair.role_diversity > kHighDiversity) ++stats.high_role_diversity;
    }
    if (stats.pairs > 0) {
      stats.avg_genre_diversity = genre_sum / static_cast<double>(stats.pairs);
      stats.avg_role_diversity  = role_sum / static_cast<double>(stats.pairs);
    }
    return stats;
  });
}

std::optional<std::vector<YearlyTrend>> CollaborationGraph::PersonYearlyTrends(PersonId person) {
  return Read("person_yearly_trends", [&](db::Transaction& tx) -> std::optional<std::vector<YearlyTrend>> {
    if (!repository_->PersonExists(tx, person)) return std::nullopt;

    struct YearAccumulator {
      std::set<PersonId> collaborators;

      // one representative detail per work
      std::map<model::WorkId, const db::model::CollaborationDetailRecord*> works;
    };

    const auto                              details = repository_->ListDetailsForPerson(tx, person);
    std::map<std::int32_t, YearAccumulator> by_year;
    for (const auto& detail : details) {
      auto& acc = by_year[detail.year];
      acc.collaborators.insert(detail.pair.Other(person));
      acc.works.emplace(detail.work_id, &detail);
    }

    std::vector<YearlyTrend> out;
    std::set<PersonId>       seen;
    for (const auto& [year, acc] : by_year) {
      YearlyTrend trend;
      trend.year                 = year;
      trend.unique_collaborators = static_cast<std::int64_t>(acc.collaborators.size());
      trend.works                = static_cast<std::int64_t>(acc.works.size());

      for (const auto other : acc.collaborators) {
        if (seen.insert(other).second) ++trend.new_collaborators;
      }

      double                rating_sum   = 0.0;
      std::int64_t          rating_count = 0;
      std::set<std::string> genres;
      for (const auto& [_, work] : acc.works) {
        if (work->rating) {
          rating_sum += *work->rating;
          ++rating_count;
        }
        trend.total_revenue += work->revenue.value_or(0);
        genres.insert(work->genres.begin(), work->genres.end());
      }
      if (rating_count > 0) trend.avg_rating = rating_sum / static_cast<double>(rating_count);
      trend.distinct_genres = static_cast<std::int64_t>(genres.size());

      out.push_back(trend);
    }

    std::reverse(out.begin(), out.end());
    return out;
  });
}

GraphStats CollaborationGraph::Stats() {
  GraphStats stats;
  stats.counts            = Read("stats", [&](db::Transaction& tx) { return repository_->CountRows(tx); });
  stats.path_computations = path_finder_->Computations();
  stats.path_cache_hits   = path_finder_->CacheHits();
  return stats;
}

graph::ApplyReport CollaborationGraph::ApplyIncremental(model::WorkId work_id) {
  return store_->ApplyIncremental(work_id);
}

graph::RebuildReport CollaborationGraph::RebuildAll() {
  return store_->RebuildAll();
}

graph::TrendRefreshReport CollaborationGraph::RefreshTrends() {
  return trends_->Refresh();
}

} // namespace collab::core
