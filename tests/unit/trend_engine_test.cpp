#include "internal/graph/trend_engine.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <future>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/aggregate_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using collab::graph::TrendEngine;
using collab::graph::TrendEngineOptions;
using collab::model::PersonPair;
using namespace collab::testing;

void SeedPairWorks(collab::db::Repository& repo, collab::graph::AggregateStore& store, std::int64_t first_work, std::int64_t a,
                   std::int64_t b, std::initializer_list<std::int32_t> years) {
  auto work_id = first_work;
  for (const auto year : years) {
    SeedWork(repo, Work(work_id, year), {Performer(work_id, a, 1), Performer(work_id, b, 2)});
    store.ApplyIncremental(work_id);
    ++work_id;
  }
}

void TestRecentPairOutranksOldPair() {
  auto                          repo = std::make_shared<collab::db::memory::MemoryRepository>();
  collab::graph::AggregateStore store(repo, collab::graph::EdgeBuilder(DefaultPolicy()));

  SeedPairWorks(*repo, store, 1, 1, 2, {2024, 2024, 2024});
  SeedPairWorks(*repo, store, 10, 3, 4, {2019, 2019, 2019});
  SeedPairWorks(*repo, store, 20, 5, 6, {2019, 2019, 2019, 2023});

  ManualClock        clock(MidYear(2024));
  TrendEngineOptions options;
  options.clock = clock.Fn();
  TrendEngine engine(repo, options);

  const auto report = engine.Refresh();
  assert(report.reference_year == 2024);
  assert(report.rows == 2);

  const auto top = engine.TopTrending(10);
  assert(top.size() == 2);
  assert((top[0].pair == PersonPair{1, 2}));
  assert(top[0].recent_count == 3);
  assert(top[0].baseline_count == 0);
  assert(std::abs(top[0].trend_score - 3.0) < 1e-9);
  assert((top[1].pair == PersonPair{5, 6}));
  assert(top[1].recent_count == 1);
  assert(top[1].baseline_count == 3);
  assert(top[1].last_year == 2023);

  assert(engine.TopTrending(1).size() == 1);
}

void TestSnapshotIsReplacedOnRefresh() {
  auto                          repo = std::make_shared<collab::db::memory::MemoryRepository>();
  collab::graph::AggregateStore store(repo, collab::graph::EdgeBuilder(DefaultPolicy()));
  SeedPairWorks(*repo, store, 1, 1, 2, {2023});

  ManualClock        clock(MidYear(2024));
  TrendEngineOptions options;
  options.clock = clock.Fn();
  TrendEngine engine(repo, options);

  engine.Refresh();
  assert(engine.TopTrending(10).size() == 1);

  // ten years later nothing is recent any more
  clock.Advance(std::chrono::hours(24 * 366 * 10));
  const auto report = engine.Refresh();
  assert(report.rows == 0);
  assert(engine.TopTrending(10).empty());
}

void TestScoreDecaysWithAge() {
  collab::db::model::CollaborationDetailRecord current;
  current.pair    = PersonPair{1, 2};
  current.work_id = 1;
  current.year    = 2024;

  auto last_year    = current;
  last_year.pair    = PersonPair{3, 4};
  last_year.work_id = 2;
  last_year.year    = 2023;

  const auto rows = TrendEngine::Score({current, last_year}, 2024, 2, 0);
  assert(rows.size() == 2);
  assert(std::abs(rows[0].trend_score - 1.0) < 1e-9);
  assert(std::abs(rows[1].trend_score - std::exp2(-0.5)) < 1e-9);
  assert(rows[0].trend_score > rows[1].trend_score);
}

void TestWindowMustBePositive() {
  TrendEngineOptions options;
  options.window_years = 0;

  bool threw = false;
  try {
    TrendEngine engine(std::make_shared<collab::db::memory::MemoryRepository>(), options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

// Holds the first refresh inside its scan until released.
class ParkedRepository final : public DelegatingRepository {
 public:
  explicit ParkedRepository(std::shared_ptr<collab::db::Repository> inner) : DelegatingRepository(std::move(inner)) {
  }

  std::vector<collab::db::model::CollaborationDetailRecord> ListAllDetails(collab::db::Transaction& tx) override {
    if (!parked_.exchange(true)) {
      entered.set_value();
      release_future.wait();
    }
    return inner_->ListAllDetails(tx);
  }

  std::promise<void>       entered;
  std::promise<void>       release;
  std::shared_future<void> release_future = release.get_future().share();

 private:
  std::atomic<bool> parked_{false};
};

void TestOverlappingRefreshIsRejected() {
  auto                          inner = std::make_shared<collab::db::memory::MemoryRepository>();
  collab::graph::AggregateStore store(inner, collab::graph::EdgeBuilder(DefaultPolicy()));
  SeedPairWorks(*inner, store, 1, 1, 2, {2024});

  ManualClock        clock(MidYear(2024));
  TrendEngineOptions options;
  options.clock = clock.Fn();
  auto        repo = std::make_shared<ParkedRepository>(inner);
  TrendEngine engine(repo, options);

  auto entered = repo->entered.get_future();
  auto first   = std::async(std::launch::async, [&] { return engine.Refresh(); });
  entered.wait();

  bool rejected = false;
  try {
    engine.Refresh();
  } catch (const collab::util::AlreadyRunning&) {
    rejected = true;
  }
  assert(rejected);

  repo->release.set_value();
  assert(first.get().rows == 1);

  // the flight is released once the first refresh returns
  assert(engine.Refresh().rows == 1);
}

} // namespace

int main() {
  TestRecentPairOutranksOldPair();
  TestSnapshotIsReplacedOnRefresh();
  TestScoreDecaysWithAge();
  TestWindowMustBePositive();
  TestOverlappingRefreshIsRejected();

  std::cout << "collab_unit_trend_engine: pass\n";
  return 0;
}
