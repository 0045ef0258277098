#include "internal/service/graph_service.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

namespace pb = collab::graph::v1;

using collab::service::GraphService;
using namespace collab::testing;

GraphService SeededService() {
  auto repo  = std::make_shared<collab::db::memory::MemoryRepository>();
  auto graph = MakeGraph(repo);

  SeedWork(*repo, Work(1, 2001, 8.0, 100, {"Drama"}), {Director(1, 1), Performer(1, 2, 1), Performer(1, 3, 2)});
  SeedWork(*repo, Work(2, 2003, 6.0, 50, {"Drama"}), {Director(2, 1), Performer(2, 3, 1), Performer(2, 4, 2)});
  graph->ApplyIncremental(1);
  graph->ApplyIncremental(2);

  return GraphService(collab::service::ServiceContext{graph});
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestPairStatsRoundTrip() {
  auto service = SeededService();

  pb::GetPairStatsRequest req;
  req.set_person_a(3);
  req.set_person_b(1);
  const auto resp = service.GetPairStats(req);

  assert(resp.stats().pair().person_low_id() == 1);
  assert(resp.stats().pair().person_high_id() == 3);
  assert(resp.stats().collaboration_count() == 2);
  assert(resp.stats().has_avg_rating());
  assert(resp.stats().avg_rating() == 7.0);
  assert(resp.stats().types_size() == 1);
  assert(resp.stats().types(0) == pb::COLLABORATION_TYPE_PERFORMER_DIRECTOR);
  assert(resp.stats().years_active_size() == 2);
}

void TestMissingRowsAreNotFound() {
  auto service = SeededService();

  pb::GetPairStatsRequest pair;
  pair.set_person_a(2);
  pair.set_person_b(4);
  assert(Throws<collab::util::NotFound>([&] { service.GetPairStats(pair); }));

  pb::ListTopCollaboratorsRequest top;
  top.set_person_id(99);
  assert(Throws<collab::util::NotFound>([&] { service.ListTopCollaborators(top); }));

  pb::GetPersonYearlyTrendsRequest yearly;
  yearly.set_person_id(99);
  assert(Throws<collab::util::NotFound>([&] { service.GetPersonYearlyTrends(yearly); }));

  pb::ListSimilarCollaborationsRequest similar;
  similar.set_person_a(2);
  similar.set_person_b(4);
  assert(Throws<collab::util::NotFound>([&] { service.ListSimilarCollaborations(similar); }));

  pb::FindShortestPathRequest path;
  path.set_person_a(1);
  path.set_person_b(99);
  assert(Throws<collab::util::NotFound>([&] { service.FindShortestPath(path); }));
}

void TestInvalidArgumentsAreRejected() {
  auto service = SeededService();

  pb::GetPairStatsRequest same;
  same.set_person_a(2);
  same.set_person_b(2);
  assert(Throws<collab::util::InvalidArgument>([&] { service.GetPairStats(same); }));

  pb::GetPairStatsRequest negative;
  negative.set_person_a(-1);
  negative.set_person_b(2);
  assert(Throws<collab::util::InvalidArgument>([&] { service.GetPairStats(negative); }));

  pb::FindShortestPathRequest depth;
  depth.set_person_a(2);
  depth.set_person_b(4);
  depth.set_max_depth(0);
  assert(Throws<collab::util::InvalidArgument>([&] { service.FindShortestPath(depth); }));

  pb::ListTopCollaboratorsRequest bad_type;
  bad_type.set_person_id(1);
  bad_type.set_type(static_cast<pb::CollaborationType>(42));
  assert(Throws<collab::util::InvalidArgument>([&] { service.ListTopCollaborators(bad_type); }));

  pb::ListTopCollaboratorsRequest negative_limit;
  negative_limit.set_person_id(1);
  negative_limit.set_limit(-3);
  assert(Throws<collab::util::InvalidArgument>([&] { service.ListTopCollaborators(negative_limit); }));

  pb::ListTopCollaboratorsRequest zero_limit;
  zero_limit.set_person_id(1);
  zero_limit.set_limit(0);
  assert(Throws<collab::util::InvalidArgument>([&] { service.ListTopCollaborators(zero_limit); }));

  pb::ListTrendingPairsRequest trending;
  trending.set_limit(-1);
  assert(Throws<collab::util::InvalidArgument>([&] { service.ListTrendingPairs(trending); }));

  pb::ListSimilarCollaborationsRequest similar;
  similar.set_person_a(1);
  similar.set_person_b(3);
  similar.set_limit(-10);
  assert(Throws<collab::util::InvalidArgument>([&] { service.ListSimilarCollaborations(similar); }));

  pb::ApplyWorkRequest unknown_work;
  unknown_work.set_work_id(404);
  assert(Throws<collab::util::InvalidArgument>([&] { service.ApplyWork(unknown_work); }));
}

void TestShortestPathWithHops() {
  auto service = SeededService();

  pb::FindShortestPathRequest req;
  req.set_person_a(2);
  req.set_person_b(4);
  req.set_include_works(true);
  const auto resp = service.FindShortestPath(req);

  assert(resp.found());
  assert(resp.length() == 2);
  assert(resp.path_size() == 3);
  assert(resp.path(0) == 2 && resp.path(2) == 4);
  assert(resp.hops_size() == 2);
  assert(!resp.from_cache());

  req.set_max_depth(1);
  req.set_include_works(false);
  const auto limited = service.FindShortestPath(req);
  assert(!limited.found());
  assert(limited.path_size() == 0);
  assert(limited.from_cache());
}

void TestFiltersAndListings() {
  auto service = SeededService();

  pb::ListTopCollaboratorsRequest top;
  top.set_person_id(3);
  top.set_type(pb::COLLABORATION_TYPE_PERFORMER_PERFORMER);
  const auto performers = service.ListTopCollaborators(top);
  assert(performers.collaborators_size() == 2);
  assert(performers.collaborators(0).person_id() == 2);
  assert(performers.collaborators(0).matching_works() == 1);

  pb::ListPairWorksRequest works;
  works.set_person_a(1);
  works.set_person_b(3);
  const auto shared = service.ListPairWorks(works);
  assert(shared.works_size() == 2);
  assert(shared.works(0).work_id() == 2);
  assert(shared.works(0).low_role() == pb::ROLE_CLASS_DIRECTOR);
  assert(shared.works(0).high_role() == pb::ROLE_CLASS_PERFORMER);

  pb::GetPersonYearlyTrendsRequest yearly;
  yearly.set_person_id(1);
  const auto years = service.GetPersonYearlyTrends(yearly);
  assert(years.years_size() == 2);
  assert(years.years(0).year() == 2003);
  assert(years.years(0).new_collaborators() == 1);

  const auto stats = service.GetStats(pb::GetStatsRequest{});
  assert(stats.stats().works() == 2);
  assert(stats.stats().collaborations() == 5);

  pb::ListTopCollaboratorsRequest limited;
  limited.set_person_id(1);
  limited.set_limit(1);
  const auto top_one = service.ListTopCollaborators(limited);
  assert(top_one.collaborators_size() == 1);
  assert(top_one.collaborators(0).person_id() == 3);
}

void TestSimilarAndDiversity() {
  auto repo  = std::make_shared<collab::db::memory::MemoryRepository>();
  auto graph = MakeGraph(repo);

  SeedWork(*repo, Work(1, 2001, 7.0, 0, {"Drama"}), {Director(1, 1), Performer(1, 2, 1)});
  SeedWork(*repo, Work(2, 2002, 7.0, 0, {"Drama"}), {Director(2, 1), Performer(2, 2, 1)});
  SeedWork(*repo, Work(3, 2003, 7.4, 0, {"Comedy"}), {Director(3, 5), Performer(3, 6, 1)});
  SeedWork(*repo, Work(4, 2004, 7.4, 0, {"War"}), {Director(4, 5), Performer(4, 6, 1)});
  for (const auto w : {1, 2, 3, 4}) {
    graph->ApplyIncremental(w);
  }
  GraphService service(collab::service::ServiceContext{graph});

  pb::ListSimilarCollaborationsRequest req;
  req.set_person_a(2);
  req.set_person_b(1);
  const auto similar = service.ListSimilarCollaborations(req);
  assert(similar.pairs_size() == 1);
  assert(similar.pairs(0).pair().person_low_id() == 5);
  assert(similar.pairs(0).pair().person_high_id() == 6);
  assert(similar.pairs(0).collaboration_count() == 2);

  const auto diversity = service.GetDiversityStats(pb::GetDiversityStatsRequest{});
  assert(diversity.pairs() == 2);
  // 1:2 has one genre, 5:6 has two
  assert(std::abs(diversity.avg_genre_diversity() - 0.15) < 1e-9);
  assert(std::abs(diversity.avg_role_diversity() - 0.2) < 1e-9);
  assert(diversity.high_genre_diversity() == 0);
  assert(diversity.high_role_diversity() == 0);
}

void TestAdminOperations() {
  auto service = SeededService();

  pb::ApplyWorkRequest apply;
  apply.set_work_id(1);
  const auto applied = service.ApplyWork(apply);
  assert(applied.report().work_id() == 1);
  assert(applied.report().details_unchanged() == 3);
  assert(applied.report().details_inserted() == 0);

  const auto rebuilt = service.RebuildAll(pb::RebuildAllRequest{});
  assert(rebuilt.works_applied() == 2);
  assert(rebuilt.pairs() == 5);

  const auto refreshed = service.RefreshTrends(pb::RefreshTrendsRequest{});
  assert(refreshed.rows() == 0);

  const auto trending = service.ListTrendingPairs(pb::ListTrendingPairsRequest{});
  assert(trending.pairs_size() == 0);
}

} // namespace

int main() {
  TestPairStatsRoundTrip();
  TestMissingRowsAreNotFound();
  TestInvalidArgumentsAreRejected();
  TestShortestPathWithHops();
  TestFiltersAndListings();
  TestAdminOperations();
  TestSimilarAndDiversity();

  std::cout << "collab_unit_graph_service: pass\n";
  return 0;
}
