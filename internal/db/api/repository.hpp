#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/collaboration_record.hpp"
#include "internal/db/model/path_cache_record.hpp"
#include "internal/db/model/trend_record.hpp"
#include "internal/db/model/work_record.hpp"

namespace collab::db {

// person -> sorted neighbor ids
using NeighborMap = std::unordered_map<model::PersonId, std::vector<model::PersonId>>;

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Every pair row (collaborations, details, path cache, trends) is stored
    with low < high; backends reject anything else
  - Writes return Result; reads throw DbError on backend failure

  The DB is the source of truth for:
    catalog (works, credits)
    collaboration pairs and their per-work details
    path cache and trend snapshot
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Catalog (upstream input)
  // ---------------------------------------------------------------------

  virtual Result UpsertWork(Transaction&, const model::WorkRecord&) = 0;

  virtual std::optional<model::WorkRecord> GetWork(Transaction&, model::WorkId work_id) = 0;

  // ascending
  virtual std::vector<model::WorkId> ListWorkIds(Transaction&) = 0;

  // Replaces every credit of the work.
  virtual Result ReplaceCredits(Transaction&, model::WorkId work_id, const std::vector<model::CreditRecord>& credits) = 0;

  virtual std::vector<model::CreditRecord> ListCredits(Transaction&, model::WorkId work_id) = 0;

  // A person is known once any credit references them.
  virtual bool PersonExists(Transaction&, model::PersonId person) = 0;

  // ---------------------------------------------------------------------
  // Collaboration pairs
  // ---------------------------------------------------------------------

  // Serializes writers of the same pair until the transaction ends.
  virtual Result LockPair(Transaction&, const model::PersonPair&) = 0;

  virtual Result UpsertCollaboration(Transaction&, const model::CollaborationRecord&) = 0;

  virtual std::optional<model::CollaborationRecord> GetCollaboration(Transaction&, const model::PersonPair&) = 0;

  // ordered by (low, high)
  virtual std::vector<model::CollaborationRecord> ListCollaborationsForPerson(Transaction&, model::PersonId person) = 0;

  // every pair, ordered by (low, high)
  virtual std::vector<model::CollaborationRecord> ListAllCollaborations(Transaction&) = 0;

  // Adjacency of a whole BFS frontier in one round-trip.
  virtual NeighborMap ListNeighbors(Transaction&, const std::vector<model::PersonId>& frontier) = 0;

  // Removes every pair and detail row.
  virtual Result DeleteAllCollaborations(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Collaboration details
  // ---------------------------------------------------------------------

  // AlreadyExists when the (pair, work) row is present.
  virtual Result InsertDetail(Transaction&, const model::CollaborationDetailRecord&) = 0;

  virtual Result UpdateDetail(Transaction&, const model::CollaborationDetailRecord&) = 0;

  virtual std::optional<model::CollaborationDetailRecord> GetDetail(Transaction&, const model::PersonPair&, model::WorkId work_id) = 0;

  // ordered by work_id
  virtual std::vector<model::CollaborationDetailRecord> ListDetailsForPair(Transaction&, const model::PersonPair&) = 0;

  // ordered by (low, high, work_id)
  virtual std::vector<model::CollaborationDetailRecord> ListDetailsForPerson(Transaction&, model::PersonId person) = 0;

  // ordered by (low, high, work_id)
  virtual std::vector<model::CollaborationDetailRecord> ListAllDetails(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Path cache
  // ---------------------------------------------------------------------

  virtual Result UpsertPathCache(Transaction&, const model::PathCacheRecord&) = 0;

  virtual std::optional<model::PathCacheRecord> GetPathCache(Transaction&, const model::PersonPair&) = 0;

  // Deletes rows computed before cutoff_ms.
  virtual Result DeleteExpiredPathCache(Transaction&, std::uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Trend snapshot
  // ---------------------------------------------------------------------

  // Drops the previous snapshot and writes the new one.
  virtual Result ReplaceTrendSnapshot(Transaction&, const std::vector<model::TrendRecord>& rows) = 0;

  // score desc, recent_count desc, (low, high) asc
  virtual std::vector<model::TrendRecord> ListTrending(Transaction&, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Stats
  // ---------------------------------------------------------------------

  virtual model::GraphCounts CountRows(Transaction&) = 0;
};

} // namespace collab::db
