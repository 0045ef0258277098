#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/collaboration_graph.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/edge_builder.hpp"
#include "internal/util/time.hpp"

namespace collab::testing {

using model::PersonId;
using model::WorkId;

db::model::WorkRecord Work(WorkId id, std::int32_t year, std::optional<double> rating = std::nullopt,
                           std::optional<std::int64_t> revenue = std::nullopt, std::vector<std::string> genres = {});

db::model::CreditRecord Performer(WorkId work, PersonId person, std::int32_t ordinal);
db::model::CreditRecord Director(WorkId work, PersonId person);
db::model::CreditRecord Crew(WorkId work, PersonId person, std::string role);

// Writes the work and replaces its credits in one committed transaction.
void SeedWork(db::Repository& repo, const db::model::WorkRecord& work, const std::vector<db::model::CreditRecord>& credits);

// caps 10 / 20, key crew Screenplay, Editor, Producer
graph::EdgePolicy DefaultPolicy();

// Graph over the repository with inline path cache writes and no worker pool.
std::shared_ptr<core::CollaborationGraph> MakeGraph(std::shared_ptr<db::Repository> repo, util::ClockFn clock = util::Now);

// Clock under test control. Copies share the same instant.
class ManualClock {
 public:
  explicit ManualClock(util::TimePoint start);

  util::ClockFn Fn() const;
  void          Advance(std::chrono::milliseconds delta);

 private:
  std::shared_ptr<std::atomic<std::uint64_t>> now_ms_;
};

// UTC instant inside the given calendar year (July 1st).
util::TimePoint MidYear(int year);

/*
  Forwards every call to an inner repository. Tests override single methods
  to inject failures or observe calls.
*/
class DelegatingRepository : public db::Repository {
 public:
  explicit DelegatingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result UpsertWork(db::Transaction& tx, const db::model::WorkRecord& r) override {
    return inner_->UpsertWork(tx, r);
  }
  std::optional<db::model::WorkRecord> GetWork(db::Transaction& tx, WorkId id) override {
    return inner_->GetWork(tx, id);
  }
  std::vector<WorkId> ListWorkIds(db::Transaction& tx) override {
    return inner_->ListWorkIds(tx);
  }
  db::Result ReplaceCredits(db::Transaction& tx, WorkId id, const std::vector<db::model::CreditRecord>& c) override {
    return inner_->ReplaceCredits(tx, id, c);
  }
  std::vector<db::model::CreditRecord> ListCredits(db::Transaction& tx, WorkId id) override {
    return inner_->ListCredits(tx, id);
  }
  bool PersonExists(db::Transaction& tx, PersonId p) override {
    return inner_->PersonExists(tx, p);
  }

  db::Result LockPair(db::Transaction& tx, const model::PersonPair& p) override {
    return inner_->LockPair(tx, p);
  }
  db::Result UpsertCollaboration(db::Transaction& tx, const db::model::CollaborationRecord& r) override {
    return inner_->UpsertCollaboration(tx, r);
  }
  std::optional<db::model::CollaborationRecord> GetCollaboration(db::Transaction& tx, const model::PersonPair& p) override {
    return inner_->GetCollaboration(tx, p);
  }
  std::vector<db::model::CollaborationRecord> ListCollaborationsForPerson(db::Transaction& tx, PersonId p) override {
    return inner_->ListCollaborationsForPerson(tx, p);
  }
  std::vector<db::model::CollaborationRecord> ListAllCollaborations(db::Transaction& tx) override {
    return inner_->ListAllCollaborations(tx);
  }
  db::NeighborMap ListNeighbors(db::Transaction& tx, const std::vector<PersonId>& frontier) override {
    return inner_->ListNeighbors(tx, frontier);
  }
  db::Result DeleteAllCollaborations(db::Transaction& tx) override {
    return inner_->DeleteAllCollaborations(tx);
  }

  db::Result InsertDetail(db::Transaction& tx, const db::model::CollaborationDetailRecord& r) override {
    return inner_->InsertDetail(tx, r);
  }
  db::Result UpdateDetail(db::Transaction& tx, const db::model::CollaborationDetailRecord& r) override {
    return inner_->UpdateDetail(tx, r);
  }
  std::optional<db::model::CollaborationDetailRecord> GetDetail(db::Transaction& tx, const model::PersonPair& p, WorkId w) override {
    return inner_->GetDetail(tx, p, w);
  }
  std::vector<db::model::CollaborationDetailRecord> ListDetailsForPair(db::Transaction& tx, const model::PersonPair& p) override {
    return inner_->ListDetailsForPair(tx, p);
  }
  std::vector<db::model::CollaborationDetailRecord> ListDetailsForPerson(db::Transaction& tx, PersonId p) override {
    return inner_->ListDetailsForPerson(tx, p);
  }
  std::vector<db::model::CollaborationDetailRecord> ListAllDetails(db::Transaction& tx) override {
    return inner_->ListAllDetails(tx);
  }

  db::Result UpsertPathCache(db::Transaction& tx, const db::model::PathCacheRecord& r) override {
    return inner_->UpsertPathCache(tx, r);
  }
  std::optional<db::model::PathCacheRecord> GetPathCache(db::Transaction& tx, const model::PersonPair& p) override {
    return inner_->GetPathCache(tx, p);
  }
  db::Result DeleteExpiredPathCache(db::Transaction& tx, std::uint64_t cutoff_ms) override {
    return inner_->DeleteExpiredPathCache(tx, cutoff_ms);
  }

  db::Result ReplaceTrendSnapshot(db::Transaction& tx, const std::vector<db::model::TrendRecord>& rows) override {
    return inner_->ReplaceTrendSnapshot(tx, rows);
  }
  std::vector<db::model::TrendRecord> ListTrending(db::Transaction& tx, std::size_t limit) override {
    return inner_->ListTrending(tx, limit);
  }

  db::model::GraphCounts CountRows(db::Transaction& tx) override {
    return inner_->CountRows(tx);
  }

 protected:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace collab::testing
