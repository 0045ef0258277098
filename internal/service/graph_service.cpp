#include "graph_service.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

#include "internal/core/collaboration_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace collab::service {

namespace pb = collab::graph::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  collab::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    auto result = fn();
    collab::observability::Metrics::Instance().RecordRequest(route, true);
    collab::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    COLLAB_LOG_ERROR("RPC failed", {collab::observability::StringField("route", route), collab::observability::StringField("error", ex.what())});
    collab::observability::Metrics::Instance().RecordRequest(route, false);
    collab::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

std::optional<model::CollaborationType> TypeFilter(pb::CollaborationType type) {
  if (type == pb::COLLABORATION_TYPE_UNSPECIFIED) return std::nullopt;
  if (!pb::CollaborationType_IsValid(type)) {
    throw util::InvalidArgument("unknown collaboration type: " + std::to_string(type));
  }
  return static_cast<model::CollaborationType>(type);
}

std::optional<model::RoleKind> RoleFilter(pb::RoleClass role) {
  if (role == pb::ROLE_CLASS_UNSPECIFIED) return std::nullopt;
  if (!pb::RoleClass_IsValid(role)) {
    throw util::InvalidArgument("unknown role class: " + std::to_string(role));
  }
  return static_cast<model::RoleKind>(role);
}

pb::CollaborationType ToProto(model::CollaborationType type) {
  return static_cast<pb::CollaborationType>(type);
}

pb::RoleClass ToProto(model::RoleKind role) {
  return static_cast<pb::RoleClass>(role);
}

void FillPair(const model::PersonPair& pair, pb::PersonPair* out) {
  out->set_person_low_id(pair.low);
  out->set_person_high_id(pair.high);
}

void FillStats(const db::model::CollaborationRecord& record, pb::CollaborationStats* out) {
  FillPair(record.pair, out->mutable_pair());
  out->set_collaboration_count(record.collaboration_count);
  out->set_first_year(record.first_year);
  out->set_last_year(record.last_year);
  if (record.avg_rating) out->set_avg_rating(*record.avg_rating);
  out->set_total_revenue(record.total_revenue);
  for (const auto type : record.types.Types()) {
    out->add_types(ToProto(type));
  }
  for (const auto year : record.years_active) {
    out->add_years_active(year);
  }
  out->set_peak_year(record.peak_year);
  out->set_genre_diversity(record.genre_diversity);
  out->set_role_diversity(record.role_diversity);
  *out->mutable_updated_at() = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
}

void FillReport(const collab::graph::ApplyReport& report, pb::ApplyReport* out) {
  out->set_work_id(report.work_id);
  out->set_candidates(report.build.candidates);
  out->set_skipped_credits(report.build.skipped_credits);
  out->set_self_pairs_rejected(report.build.self_pairs_rejected);
  out->set_details_inserted(report.details_inserted);
  out->set_details_updated(report.details_updated);
  out->set_details_unchanged(report.details_unchanged);
  out->set_attempts(report.attempts);
}

void RequirePerson(std::int64_t person, const char* field) {
  if (person <= 0) {
    throw util::InvalidArgument(std::string(field) + " must be a positive person id");
  }
}

// Absent limits take the default; a present one must be positive.
template <typename Req>
std::size_t LimitOf(const Req& req, std::size_t fallback) {
  if (!req.has_limit()) return fallback;
  if (req.limit() <= 0) {
    throw util::InvalidArgument("limit must be positive, got " + std::to_string(req.limit()));
  }
  return static_cast<std::size_t>(req.limit());
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

pb::GetPairStatsResponse GraphService::GetPairStats(const pb::GetPairStatsRequest& req) {
  return ObserveRpc("CollaborationGraphService.GetPairStats", [&] {
    RequirePerson(req.person_a(), "person_a");
    RequirePerson(req.person_b(), "person_b");

    const auto stats = ctx_.graph->PairStats(req.person_a(), req.person_b());
    if (!stats) {
      throw util::NotFound("no collaboration between " + std::to_string(req.person_a()) + " and " + std::to_string(req.person_b()));
    }

    pb::GetPairStatsResponse resp;
    FillStats(*stats, resp.mutable_stats());
    return resp;
  });
}

pb::ListTopCollaboratorsResponse GraphService::ListTopCollaborators(const pb::ListTopCollaboratorsRequest& req) {
  return ObserveRpc("CollaborationGraphService.ListTopCollaborators", [&] {
    RequirePerson(req.person_id(), "person_id");

    core::CollaboratorFilter filter;
    filter.type    = TypeFilter(req.type());
    filter.as_role = RoleFilter(req.as_role());
    filter.limit   = LimitOf(req, filter.limit);
    if (req.min_collaborations() > 0) filter.min_collaborations = req.min_collaborations();

    const auto ranked = ctx_.graph->TopCollaborators(req.person_id(), filter);
    if (!ranked) {
      throw util::NotFound("unknown person: " + std::to_string(req.person_id()));
    }

    pb::ListTopCollaboratorsResponse resp;
    for (const auto& entry : *ranked) {
      auto* out = resp.add_collaborators();
      out->set_person_id(entry.person_id);
      out->set_collaboration_count(entry.collaboration_count);
      out->set_matching_works(entry.matching_works);
      if (entry.avg_rating) out->set_avg_rating(*entry.avg_rating);
    }
    return resp;
  });
}

pb::FindShortestPathResponse GraphService::FindShortestPath(const pb::FindShortestPathRequest& req) {
  return ObserveRpc("CollaborationGraphService.FindShortestPath", [&] {
    RequirePerson(req.person_a(), "person_a");
    RequirePerson(req.person_b(), "person_b");

    const auto depth = req.has_max_depth() ? std::optional<std::int32_t>(req.max_depth()) : std::nullopt;

    collab::graph::PathWithWorks found;
    if (req.include_works()) {
      found = ctx_.graph->ShortestPathWithWorks(req.person_a(), req.person_b(), depth);
    } else {
      found.result = ctx_.graph->ShortestPath(req.person_a(), req.person_b(), depth);
    }

    if (found.result.status == collab::graph::PathStatus::kUnknownPerson) {
      throw util::NotFound("unknown person in path query: " + std::to_string(req.person_a()) + ", " + std::to_string(req.person_b()));
    }

    pb::FindShortestPathResponse resp;
    resp.set_found(found.result.Found());
    resp.set_from_cache(found.result.from_cache);
    if (found.result.Found()) {
      resp.set_length(found.result.length);
      for (const auto person : found.result.path) {
        resp.add_path(person);
      }
    }
    for (const auto& hop : found.hops) {
      auto* out = resp.add_hops();
      out->set_from_person_id(hop.from);
      out->set_to_person_id(hop.to);
      out->set_work_id(hop.work_id);
      out->set_release_year(hop.release_year);
    }
    return resp;
  });
}

pb::ListTrendingPairsResponse GraphService::ListTrendingPairs(const pb::ListTrendingPairsRequest& req) {
  return ObserveRpc("CollaborationGraphService.ListTrendingPairs", [&] {
    const std::size_t limit = LimitOf(req, 10);

    pb::ListTrendingPairsResponse resp;
    for (const auto& row : ctx_.graph->TopTrending(limit)) {
      auto* out = resp.add_pairs();
      FillPair(row.pair, out->mutable_pair());
      out->set_trend_score(row.trend_score);
      out->set_recent_count(row.recent_count);
      out->set_baseline_count(row.baseline_count);
      out->set_last_year(row.last_year);
    }
    return resp;
  });
}

pb::ListSimilarCollaborationsResponse GraphService::ListSimilarCollaborations(const pb::ListSimilarCollaborationsRequest& req) {
  return ObserveRpc("CollaborationGraphService.ListSimilarCollaborations", [&] {
    RequirePerson(req.person_a(), "person_a");
    RequirePerson(req.person_b(), "person_b");
    const std::size_t limit = LimitOf(req, 10);

    const auto similar = ctx_.graph->SimilarCollaborations(req.person_a(), req.person_b(), limit);
    if (!similar) {
      throw util::NotFound("no collaboration between " + std::to_string(req.person_a()) + " and " + std::to_string(req.person_b()));
    }

    pb::ListSimilarCollaborationsResponse resp;
    for (const auto& record : *similar) {
      FillStats(record, resp.add_pairs());
    }
    return resp;
  });
}

pb::GetDiversityStatsResponse GraphService::GetDiversityStats(const pb::GetDiversityStatsRequest&) {
  return ObserveRpc("CollaborationGraphService.GetDiversityStats", [&] {
    const auto stats = ctx_.graph->Diversity();

    pb::GetDiversityStatsResponse resp;
    resp.set_pairs(stats.pairs);
    resp.set_avg_genre_diversity(stats.avg_genre_diversity);
    resp.set_avg_role_diversity(stats.avg_role_diversity);
    resp.set_high_genre_diversity(stats.high_genre_diversity);
    resp.set_high_role_diversity(stats.high_role_diversity);
    return resp;
  });
}

pb::ListPairWorksResponse GraphService::ListPairWorks(const pb::ListPairWorksRequest& req) {
  return ObserveRpc("CollaborationGraphService.ListPairWorks", [&] {
    RequirePerson(req.person_a(), "person_a");
    RequirePerson(req.person_b(), "person_b");

    pb::ListPairWorksResponse resp;
    for (const auto& detail : ctx_.graph->PairWorks(req.person_a(), req.person_b(), TypeFilter(req.type()))) {
      auto* out = resp.add_works();
      out->set_work_id(detail.work_id);
      out->set_type(ToProto(detail.type));
      out->set_low_role(ToProto(detail.low_role));
      out->set_high_role(ToProto(detail.high_role));
      out->set_release_year(detail.year);
      if (detail.rating) out->set_rating(*detail.rating);
      if (detail.revenue) out->set_revenue(*detail.revenue);
      for (const auto& genre : detail.genres) {
        out->add_genres(genre);
      }
    }
    return resp;
  });
}

pb::GetPersonYearlyTrendsResponse GraphService::GetPersonYearlyTrends(const pb::GetPersonYearlyTrendsRequest& req) {
  return ObserveRpc("CollaborationGraphService.GetPersonYearlyTrends", [&] {
    RequirePerson(req.person_id(), "person_id");

    const auto years = ctx_.graph->PersonYearlyTrends(req.person_id());
    if (!years) {
      throw util::NotFound("unknown person: " + std::to_string(req.person_id()));
    }

    pb::GetPersonYearlyTrendsResponse resp;
    for (const auto& year : *years) {
      auto* out = resp.add_years();
      out->set_year(year.year);
      out->set_unique_collaborators(year.unique_collaborators);
      out->set_new_collaborators(year.new_collaborators);
      out->set_works(year.works);
      if (year.avg_rating) out->set_avg_rating(*year.avg_rating);
      out->set_total_revenue(year.total_revenue);
      out->set_distinct_genres(year.distinct_genres);
    }
    return resp;
  });
}

pb::GetStatsResponse GraphService::GetStats(const pb::GetStatsRequest&) {
  return ObserveRpc("CollaborationGraphService.GetStats", [&] {
    const auto stats = ctx_.graph->Stats();

    pb::GetStatsResponse resp;
    auto*                out = resp.mutable_stats();
    out->set_works(stats.counts.works);
    out->set_credits(stats.counts.credits);
    out->set_collaborations(stats.counts.collaborations);
    out->set_details(stats.counts.details);
    out->set_cached_paths(stats.counts.cached_paths);
    out->set_trend_rows(stats.counts.trend_rows);
    out->set_path_computations(stats.path_computations);
    out->set_path_cache_hits(stats.path_cache_hits);
    return resp;
  });
}

pb::ApplyWorkResponse GraphService::ApplyWork(const pb::ApplyWorkRequest& req) {
  return ObserveRpc("CollaborationGraphService.ApplyWork", [&] {
    pb::ApplyWorkResponse resp;
    FillReport(ctx_.graph->ApplyIncremental(req.work_id()), resp.mutable_report());
    return resp;
  });
}

pb::RebuildAllResponse GraphService::RebuildAll(const pb::RebuildAllRequest&) {
  return ObserveRpc("CollaborationGraphService.RebuildAll", [&] {
    const auto report = ctx_.graph->RebuildAll();

    pb::RebuildAllResponse resp;
    resp.set_works_applied(static_cast<std::int64_t>(report.works_applied));
    resp.set_works_failed(static_cast<std::int64_t>(report.works_failed));
    resp.set_pairs(report.pairs);
    resp.set_duration_ms(static_cast<std::int64_t>(std::llround(report.duration_ms)));
    return resp;
  });
}

pb::RefreshTrendsResponse GraphService::RefreshTrends(const pb::RefreshTrendsRequest&) {
  return ObserveRpc("CollaborationGraphService.RefreshTrends", [&] {
    const auto report = ctx_.graph->RefreshTrends();

    pb::RefreshTrendsResponse resp;
    resp.set_rows(static_cast<std::int64_t>(report.rows));
    resp.set_reference_year(report.reference_year);
    return resp;
  });
}

} // namespace collab::service
