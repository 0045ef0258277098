#include "internal/graph/aggregates.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace collab::graph {

db::model::CollaborationRecord ComputeAggregates(const model::PersonPair& pair, const std::vector<db::model::CollaborationDetailRecord>& details,
                                                 std::uint64_t now_ms) {
  if (details.empty()) {
    throw std::invalid_argument("cannot aggregate a pair without details");
  }

  db::model::CollaborationRecord record;
  record.pair                = pair;
  record.collaboration_count = static_cast<std::int64_t>(details.size());
  record.first_year          = details.front().year;
  record.last_year           = details.front().year;
  record.updated_at_ms       = now_ms;

  double                              rating_sum   = 0.0;
  std::int64_t                        rating_count = 0;
  std::map<std::int32_t, std::int64_t> works_per_year;
  std::set<std::string>               genres;

  for (const auto& detail : details) {
    record.first_year = std::min(record.first_year, detail.year);
    record.last_year  = std::max(record.last_year, detail.year);

    if (detail.rating) {
      rating_sum += *detail.rating;
      ++rating_count;
    }
    if (detail.revenue) {
      record.total_revenue += *detail.revenue;
    }

    record.types.Add(detail.type);
    ++works_per_year[detail.year];
    genres.insert(detail.genres.begin(), detail.genres.end());
  }

  if (rating_count > 0) {
    record.avg_rating = rating_sum / static_cast<double>(rating_count);
  }

  std::int64_t peak_works = 0;
  for (const auto& [year, works] : works_per_year) {
    record.years_active.push_back(year);
    // ascending years, so strict > keeps the earliest on ties
    if (works > peak_works) {
      peak_works       = works;
      record.peak_year = year;
    }
  }

  record.genre_diversity = std::min(static_cast<double>(genres.size()) / kGenreDiversityScale, 1.0);
  record.role_diversity  = std::min(static_cast<double>(record.types.Size()) / model::kCollaborationTypeCount, 1.0);
  return record;
}

bool SameAggregates(const db::model::CollaborationRecord& a, const db::model::CollaborationRecord& b) {
  return a.pair == b.pair && a.collaboration_count == b.collaboration_count && a.first_year == b.first_year && a.last_year == b.last_year &&
         a.avg_rating == b.avg_rating && a.total_revenue == b.total_revenue && a.types == b.types && a.years_active == b.years_active &&
         a.peak_year == b.peak_year && a.genre_diversity == b.genre_diversity && a.role_diversity == b.role_diversity;
}

} // namespace collab::graph
