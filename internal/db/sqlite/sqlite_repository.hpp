#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace collab::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

} // namespace collab::db::sqlite
