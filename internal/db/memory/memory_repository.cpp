#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace collab::db::memory {

namespace {

Result RequireCanonical(const model::PersonPair& pair) {
  if (!pair.IsCanonical()) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       "pair must be stored low < high: " + std::to_string(pair.low) + "," + std::to_string(pair.high));
  }
  return Result::Ok();
}

bool CreditLess(const model::CreditRecord& a, const model::CreditRecord& b) {
  return std::tie(a.person_id, a.role_kind, a.role_name, a.billing_ordinal) <
         std::tie(b.person_id, b.role_kind, b.role_name, b.billing_ordinal);
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWork(Transaction& t, const model::WorkRecord& r) {
  TX(t).Mutable().works[r.work_id] = r;
  return Result::Ok();
}

std::optional<model::WorkRecord> MemoryRepository::GetWork(Transaction& t, model::WorkId work_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.works.find(work_id);
  if (it == s.works.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkId> MemoryRepository::ListWorkIds(Transaction& t) {
  const auto&                s = TX(t).View();
  std::vector<model::WorkId> ids;
  ids.reserve(s.works.size());
  for (const auto& [id, _] : s.works) {
    ids.push_back(id);
  }
  return ids;
}

Result MemoryRepository::ReplaceCredits(Transaction& t, model::WorkId work_id, const std::vector<model::CreditRecord>& credits) {
  auto& s = TX(t).Mutable();
  if (!s.works.contains(work_id)) return Result::Err(ErrorCode::NotFound, "unknown work " + std::to_string(work_id));

  auto& slot = s.credits[work_id];
  for (const auto& c : slot) {
    if (!c.person_id) continue;
    auto it = s.credit_refs.find(*c.person_id);
    if (it != s.credit_refs.end() && --it->second == 0) s.credit_refs.erase(it);
  }

  slot = credits;
  for (auto& c : slot) {
    c.work_id = work_id;
    if (c.person_id) ++s.credit_refs[*c.person_id];
  }
  std::sort(slot.begin(), slot.end(), CreditLess);
  return Result::Ok();
}

std::vector<model::CreditRecord> MemoryRepository::ListCredits(Transaction& t, model::WorkId work_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.credits.find(work_id);
  if (it == s.credits.end()) return {};
  return it->second;
}

bool MemoryRepository::PersonExists(Transaction& t, model::PersonId person) {
  return TX(t).View().credit_refs.contains(person);
}

// ------------------------------------------------------------------
// Collaboration pairs
// ------------------------------------------------------------------

Result MemoryRepository::LockPair(Transaction&, const model::PersonPair& pair) {
  // optimistic: conflicts surface at Commit()
  return RequireCanonical(pair);
}

Result MemoryRepository::UpsertCollaboration(Transaction& t, const model::CollaborationRecord& r) {
  if (auto res = RequireCanonical(r.pair); !res) return res;

  auto& s                     = TX(t).Mutable();
  s.collaborations[r.pair]    = r;
  s.adjacency[r.pair.low].insert(r.pair.high);
  s.adjacency[r.pair.high].insert(r.pair.low);
  return Result::Ok();
}

std::optional<model::CollaborationRecord> MemoryRepository::GetCollaboration(Transaction& t, const model::PersonPair& pair) {
  const auto& s  = TX(t).View();
  const auto  it = s.collaborations.find(pair);
  if (it == s.collaborations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CollaborationRecord> MemoryRepository::ListCollaborationsForPerson(Transaction& t, model::PersonId person) {
  const auto&                             s = TX(t).View();
  std::vector<model::CollaborationRecord> out;

  const auto adj = s.adjacency.find(person);
  if (adj == s.adjacency.end()) return out;

  for (const auto other : adj->second) {
    const auto it = s.collaborations.find(model::PersonPair::Canonical(person, other));
    if (it != s.collaborations.end()) out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.pair < b.pair; });
  return out;
}

std::vector<model::CollaborationRecord> MemoryRepository::ListAllCollaborations(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::CollaborationRecord> out;
  out.reserve(s.collaborations.size());
  for (const auto& [pair, record] : s.collaborations) out.push_back(record);
  return out;
}

NeighborMap MemoryRepository::ListNeighbors(Transaction& t, const std::vector<model::PersonId>& frontier) {
  const auto& s = TX(t).View();
  NeighborMap out;
  for (const auto person : frontier) {
    const auto it = s.adjacency.find(person);
    if (it == s.adjacency.end()) continue;
    out[person].assign(it->second.begin(), it->second.end());
  }
  return out;
}

Result MemoryRepository::DeleteAllCollaborations(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.collaborations.clear();
  s.adjacency.clear();
  s.details.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Details
// ------------------------------------------------------------------

Result MemoryRepository::InsertDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  if (auto res = RequireCanonical(r.pair); !res) return res;

  auto& rows = TX(t).Mutable().details[r.pair];
  if (rows.contains(r.work_id)) return Result::Err(ErrorCode::AlreadyExists);
  rows[r.work_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.details.find(r.pair);
  if (it == s.details.end() || !it->second.contains(r.work_id)) return Result::Err(ErrorCode::NotFound);
  it->second[r.work_id] = r;
  return Result::Ok();
}

std::optional<model::CollaborationDetailRecord> MemoryRepository::GetDetail(Transaction& t, const model::PersonPair& pair, model::WorkId work_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.details.find(pair);
  if (it == s.details.end()) return std::nullopt;
  const auto row = it->second.find(work_id);
  if (row == it->second.end()) return std::nullopt;
  return row->second;
}

std::vector<model::CollaborationDetailRecord> MemoryRepository::ListDetailsForPair(Transaction& t, const model::PersonPair& pair) {
  const auto&                                   s = TX(t).View();
  std::vector<model::CollaborationDetailRecord> out;
  const auto                                    it = s.details.find(pair);
  if (it == s.details.end()) return out;
  for (const auto& [_, row] : it->second) {
    out.push_back(row);
  }
  return out;
}

std::vector<model::CollaborationDetailRecord> MemoryRepository::ListDetailsForPerson(Transaction& t, model::PersonId person) {
  const auto&                                   s = TX(t).View();
  std::vector<model::CollaborationDetailRecord> out;
  for (const auto& [pair, rows] : s.details) {
    if (!pair.Contains(person)) continue;
    for (const auto& [_, row] : rows) {
      out.push_back(row);
    }
  }
  return out;
}

std::vector<model::CollaborationDetailRecord> MemoryRepository::ListAllDetails(Transaction& t) {
  const auto&                                   s = TX(t).View();
  std::vector<model::CollaborationDetailRecord> out;
  for (const auto& [_, rows] : s.details) {
    for (const auto& [__, row] : rows) {
      out.push_back(row);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Path cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPathCache(Transaction& t, const model::PathCacheRecord& r) {
  if (auto res = RequireCanonical(r.pair); !res) return res;
  TX(t).Mutable().path_cache[r.pair] = r;
  return Result::Ok();
}

std::optional<model::PathCacheRecord> MemoryRepository::GetPathCache(Transaction& t, const model::PersonPair& pair) {
  const auto& s  = TX(t).View();
  const auto  it = s.path_cache.find(pair);
  if (it == s.path_cache.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteExpiredPathCache(Transaction& t, std::uint64_t cutoff_ms) {
  auto& cache = TX(t).Mutable().path_cache;
  std::erase_if(cache, [&](const auto& entry) { return entry.second.computed_at_ms < cutoff_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Trends
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceTrendSnapshot(Transaction& t, const std::vector<model::TrendRecord>& rows) {
  for (const auto& r : rows) {
    if (auto res = RequireCanonical(r.pair); !res) return res;
  }
  TX(t).Mutable().trends = rows;
  return Result::Ok();
}

std::vector<model::TrendRecord> MemoryRepository::ListTrending(Transaction& t, std::size_t limit) {
  auto out = TX(t).View().trends;
  std::sort(out.begin(), out.end(), [](const model::TrendRecord& a, const model::TrendRecord& b) {
    if (a.trend_score != b.trend_score) return a.trend_score > b.trend_score;
    if (a.recent_count != b.recent_count) return a.recent_count > b.recent_count;
    return a.pair < b.pair;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

model::GraphCounts MemoryRepository::CountRows(Transaction& t) {
  const auto&        s = TX(t).View();
  model::GraphCounts counts;
  counts.works = s.works.size();
  for (const auto& [_, rows] : s.credits) {
    counts.credits += rows.size();
  }
  counts.collaborations = s.collaborations.size();
  for (const auto& [_, rows] : s.details) {
    counts.details += rows.size();
  }
  counts.cached_paths = s.path_cache.size();
  counts.trend_rows   = s.trends.size();
  return counts;
}

} // namespace collab::db::memory
