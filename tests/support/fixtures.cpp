#include "support/fixtures.hpp"

#include <ctime>
#include <stdexcept>
#include <utility>

namespace collab::testing {

db::model::WorkRecord Work(WorkId id, std::int32_t year, std::optional<double> rating, std::optional<std::int64_t> revenue,
                           std::vector<std::string> genres) {
  db::model::WorkRecord work;
  work.work_id      = id;
  work.release_year = year;
  work.rating       = rating;
  work.revenue      = revenue;
  work.genres       = std::move(genres);
  return work;
}

db::model::CreditRecord Performer(WorkId work, PersonId person, std::int32_t ordinal) {
  db::model::CreditRecord credit;
  credit.work_id         = work;
  credit.person_id       = person;
  credit.role_kind       = model::RoleKind::kPerformer;
  credit.billing_ordinal = ordinal;
  return credit;
}

db::model::CreditRecord Director(WorkId work, PersonId person) {
  db::model::CreditRecord credit;
  credit.work_id   = work;
  credit.person_id = person;
  credit.role_kind = model::RoleKind::kDirector;
  return credit;
}

db::model::CreditRecord Crew(WorkId work, PersonId person, std::string role) {
  db::model::CreditRecord credit;
  credit.work_id   = work;
  credit.person_id = person;
  credit.role_kind = model::RoleKind::kCrew;
  credit.role_name = std::move(role);
  return credit;
}

void SeedWork(db::Repository& repo, const db::model::WorkRecord& work, const std::vector<db::model::CreditRecord>& credits) {
  auto tx = repo.Begin();
  if (!repo.UpsertWork(*tx, work)) {
    throw std::runtime_error("seed: upsert work failed");
  }
  if (!repo.ReplaceCredits(*tx, work.work_id, credits)) {
    throw std::runtime_error("seed: replace credits failed");
  }
  tx->Commit();
}

graph::EdgePolicy DefaultPolicy() {
  return graph::EdgePolicy(10, 20, {"Screenplay", "Editor", "Producer"});
}

std::shared_ptr<core::CollaborationGraph> MakeGraph(std::shared_ptr<db::Repository> repo, util::ClockFn clock) {
  graph::AggregateStoreOptions store_options;
  store_options.clock = clock;
  auto store = std::make_shared<graph::AggregateStore>(repo, graph::EdgeBuilder(DefaultPolicy()), store_options);

  graph::PathFinderOptions path_options;
  path_options.clock = clock;
  auto path_finder   = std::make_shared<graph::PathFinder>(repo, nullptr, path_options);

  graph::TrendEngineOptions trend_options;
  trend_options.clock = clock;
  auto trends         = std::make_shared<graph::TrendEngine>(repo, trend_options);

  return std::make_shared<core::CollaborationGraph>(repo, store, path_finder, trends);
}

ManualClock::ManualClock(util::TimePoint start) : now_ms_(std::make_shared<std::atomic<std::uint64_t>>(util::ToUnixMillis(start))) {
}

util::ClockFn ManualClock::Fn() const {
  auto now_ms = now_ms_;
  return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  now_ms_->fetch_add(static_cast<std::uint64_t>(delta.count()));
}

util::TimePoint MidYear(int year) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = 6;
  tm.tm_mday = 1;
  tm.tm_hour = 12;
  return util::Clock::from_time_t(timegm(&tm));
}

} // namespace collab::testing
