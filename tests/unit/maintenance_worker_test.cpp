#include "internal/runtime/maintenance_worker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/aggregate_store.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/graph/trend_engine.hpp"
#include "support/fixtures.hpp"

namespace {

using collab::runtime::MaintenanceOptions;
using collab::runtime::MaintenanceWorker;
using namespace collab::testing;

collab::db::model::GraphCounts Counts(collab::db::Repository& repo) {
  auto       tx     = repo.Begin();
  const auto counts = repo.CountRows(*tx);
  tx->Commit();
  return counts;
}

std::shared_ptr<collab::db::Repository> RecentGraph() {
  auto                          repo = std::make_shared<collab::db::memory::MemoryRepository>();
  collab::graph::AggregateStore store(repo, collab::graph::EdgeBuilder(DefaultPolicy()));
  SeedWork(*repo, Work(1, 2024), {Performer(1, 1, 1), Performer(1, 2, 2)});
  SeedWork(*repo, Work(2, 2023), {Performer(2, 2, 1), Performer(2, 3, 2)});
  store.ApplyIncremental(1);
  store.ApplyIncremental(2);
  return repo;
}

void TestPassRefreshesTrendsAndPurgesExpiredPaths() {
  auto        repo = RecentGraph();
  ManualClock clock(MidYear(2024));

  collab::graph::PathFinderOptions path_options;
  path_options.clock = clock.Fn();
  collab::graph::PathFinder finder(repo, nullptr, path_options);
  assert(finder.ShortestPath(1, 3, 6).Found());
  assert(Counts(*repo).cached_paths == 1);

  collab::graph::TrendEngineOptions trend_options;
  trend_options.clock = clock.Fn();
  auto trends         = std::make_shared<collab::graph::TrendEngine>(repo, trend_options);

  MaintenanceOptions options;
  options.cache_ttl = std::chrono::hours(1);
  options.clock     = clock.Fn();
  MaintenanceWorker worker(repo, trends, options);

  // still fresh
  worker.RunOnce();
  assert(Counts(*repo).cached_paths == 1);
  assert(Counts(*repo).trend_rows == 2);
  assert(worker.Passes() == 1);

  clock.Advance(std::chrono::hours(2));
  worker.RunOnce();
  assert(Counts(*repo).cached_paths == 0);
  assert(Counts(*repo).trend_rows == 2);
  assert(worker.Passes() == 2);
}

void TestBackgroundLoopRunsUntilStopped() {
  auto repo   = RecentGraph();
  auto trends = std::make_shared<collab::graph::TrendEngine>(repo);

  MaintenanceOptions options;
  options.interval = std::chrono::milliseconds(5);
  MaintenanceWorker worker(repo, trends, options);
  worker.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (worker.Passes() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  worker.Stop();

  const auto passes = worker.Passes();
  assert(passes >= 2);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(worker.Passes() == passes);
}

void TestStopWithoutStartIsSafe() {
  auto              repo = RecentGraph();
  MaintenanceWorker worker(repo, std::make_shared<collab::graph::TrendEngine>(repo));
  worker.Stop();
  assert(worker.Passes() == 0);
}

} // namespace

int main() {
  TestPassRefreshesTrendsAndPurgesExpiredPaths();
  TestBackgroundLoopRunsUntilStopped();
  TestStopWithoutStartIsSafe();

  std::cout << "collab_unit_maintenance_worker: pass\n";
  return 0;
}
