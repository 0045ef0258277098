#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace collab::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertWork(Transaction&, const model::WorkRecord&) override;
  std::optional<model::WorkRecord> GetWork(Transaction&, model::WorkId) override;
  std::vector<model::WorkId> ListWorkIds(Transaction&) override;
  Result ReplaceCredits(Transaction&, model::WorkId, const std::vector<model::CreditRecord>&) override;
  std::vector<model::CreditRecord> ListCredits(Transaction&, model::WorkId) override;
  bool PersonExists(Transaction&, model::PersonId) override;

  Result LockPair(Transaction&, const model::PersonPair&) override;
  Result UpsertCollaboration(Transaction&, const model::CollaborationRecord&) override;
  std::optional<model::CollaborationRecord> GetCollaboration(Transaction&, const model::PersonPair&) override;
  std::vector<model::CollaborationRecord> ListCollaborationsForPerson(Transaction&, model::PersonId) override;
  std::vector<model::CollaborationRecord> ListAllCollaborations(Transaction&) override;
  NeighborMap ListNeighbors(Transaction&, const std::vector<model::PersonId>&) override;
  Result DeleteAllCollaborations(Transaction&) override;

  Result InsertDetail(Transaction&, const model::CollaborationDetailRecord&) override;
  Result UpdateDetail(Transaction&, const model::CollaborationDetailRecord&) override;
  std::optional<model::CollaborationDetailRecord> GetDetail(Transaction&, const model::PersonPair&, model::WorkId) override;
  std::vector<model::CollaborationDetailRecord> ListDetailsForPair(Transaction&, const model::PersonPair&) override;
  std::vector<model::CollaborationDetailRecord> ListDetailsForPerson(Transaction&, model::PersonId) override;
  std::vector<model::CollaborationDetailRecord> ListAllDetails(Transaction&) override;

  Result UpsertPathCache(Transaction&, const model::PathCacheRecord&) override;
  std::optional<model::PathCacheRecord> GetPathCache(Transaction&, const model::PersonPair&) override;
  Result DeleteExpiredPathCache(Transaction&, std::uint64_t cutoff_ms) override;

  Result ReplaceTrendSnapshot(Transaction&, const std::vector<model::TrendRecord>&) override;
  std::vector<model::TrendRecord> ListTrending(Transaction&, std::size_t limit) override;

  model::GraphCounts CountRows(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<model::WorkId, model::WorkRecord> works;
    std::map<model::WorkId, std::vector<model::CreditRecord>> credits;
    std::map<model::PersonId, std::uint64_t> credit_refs;

    std::map<model::PersonPair, model::CollaborationRecord> collaborations;
    std::map<model::PersonId, std::set<model::PersonId>> adjacency;
    std::map<model::PersonPair, std::map<model::WorkId, model::CollaborationDetailRecord>> details;

    std::map<model::PersonPair, model::PathCacheRecord> path_cache;
    std::vector<model::TrendRecord> trends;
  };

  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace collab::db::memory
