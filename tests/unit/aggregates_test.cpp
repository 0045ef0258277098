#include "internal/graph/aggregates.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using collab::db::model::CollaborationDetailRecord;
using collab::graph::ComputeAggregates;
using collab::graph::SameAggregates;
using collab::model::CollaborationType;
using collab::model::PersonPair;

const PersonPair kPair{10, 20};

CollaborationDetailRecord Detail(std::int64_t work_id, std::int32_t year, CollaborationType type, std::optional<double> rating,
                                 std::optional<std::int64_t> revenue, std::vector<std::string> genres) {
  CollaborationDetailRecord detail;
  detail.pair    = kPair;
  detail.work_id = work_id;
  detail.type    = type;
  detail.year    = year;
  detail.rating  = rating;
  detail.revenue = revenue;
  detail.genres  = std::move(genres);
  return detail;
}

void TestAggregatesFollowDetails() {
  const std::vector<CollaborationDetailRecord> details{
      Detail(1, 2001, CollaborationType::kPerformerDirector, 8.0, 100, {"Drama", "Crime"}),
      Detail(2, 1999, CollaborationType::kPerformerPerformer, std::nullopt, std::nullopt, {"Drama"}),
      Detail(3, 2001, CollaborationType::kPerformerDirector, 6.0, 50, {"Comedy"}),
  };

  const auto record = ComputeAggregates(kPair, details, 1234);

  assert(record.pair == kPair);
  assert(record.collaboration_count == 3);
  assert(record.first_year == 1999);
  assert(record.last_year == 2001);
  // unrated work is left out of the average, not counted as zero
  assert(record.avg_rating.has_value());
  assert(std::abs(*record.avg_rating - 7.0) < 1e-9);
  assert(record.total_revenue == 150);
  assert(record.types.Size() == 2);
  assert(record.types.Contains(CollaborationType::kPerformerDirector));
  assert(record.types.Contains(CollaborationType::kPerformerPerformer));
  assert((record.years_active == std::vector<std::int32_t>{1999, 2001}));
  assert(record.peak_year == 2001);
  assert(std::abs(record.genre_diversity - 0.3) < 1e-9);
  assert(std::abs(record.role_diversity - 0.4) < 1e-9);
  assert(record.updated_at_ms == 1234);
}

void TestPeakYearTieKeepsEarliest() {
  const std::vector<CollaborationDetailRecord> details{
      Detail(1, 2010, CollaborationType::kCrewCrew, std::nullopt, std::nullopt, {}),
      Detail(2, 2005, CollaborationType::kCrewCrew, std::nullopt, std::nullopt, {}),
  };

  const auto record = ComputeAggregates(kPair, details, 0);
  assert(record.peak_year == 2005);
  assert(!record.avg_rating.has_value());
  assert(record.total_revenue == 0);
  assert(record.genre_diversity == 0.0);
}

void TestGenreDiversitySaturates() {
  std::vector<std::string> genres;
  for (int i = 0; i < 14; ++i) {
    genres.push_back("genre-" + std::to_string(i));
  }
  const auto record = ComputeAggregates(kPair, {Detail(1, 2000, CollaborationType::kDirectorDirector, 5.0, 1, genres)}, 0);
  assert(record.genre_diversity == 1.0);
  assert(std::abs(record.role_diversity - 0.2) < 1e-9);
}

void TestSameAggregatesIgnoresTimestamp() {
  const std::vector<CollaborationDetailRecord> details{Detail(1, 2000, CollaborationType::kCrewCrew, 7.5, 10, {"Drama"})};

  const auto a = ComputeAggregates(kPair, details, 1);
  const auto b = ComputeAggregates(kPair, details, 999);
  assert(SameAggregates(a, b));

  auto c = b;
  c.total_revenue += 1;
  assert(!SameAggregates(a, c));
}

void TestEmptyDetailsAreRejected() {
  bool threw = false;
  try {
    (void)ComputeAggregates(kPair, {}, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAggregatesFollowDetails();
  TestPeakYearTieKeepsEarliest();
  TestGenreDiversitySaturates();
  TestSameAggregatesIgnoresTimestamp();
  TestEmptyDetailsAreRejected();

  std::cout << "collab_unit_aggregates: pass\n";
  return 0;
}
