#include "sqlite_repository.hpp"

#include <algorithm>
#include <type_traits>
#include <unordered_set>

#include "internal/db/sql/sql_codec.hpp"

namespace collab::db::sqlite {

using collab::db::ErrorCode;
using collab::db::Result;

namespace {

constexpr std::size_t kInListChunk = 500;

constexpr const char* kCollaborationColumns =
    "person_low_id,person_high_id,collaboration_count,first_year,last_year,avg_rating,total_revenue,"
    "types,years_active,peak_year,genre_diversity,role_diversity,updated_at_ms";

constexpr const char* kDetailColumns =
    "person_low_id,person_high_id,work_id,collaboration_type,low_role,high_role,release_year,rating,revenue,genres";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (!v) {
    sqlite3_bind_null(st, idx);
  } else if constexpr (std::is_floating_point_v<T>) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  }
}

void BindPair(sqlite3_stmt* st, int idx, const model::PersonPair& pair) {
  BindI64(st, idx, pair.low);
  BindI64(st, idx + 1, pair.high);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

std::int32_t ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (ColNull(st, col)) return std::nullopt;
  return sqlite3_column_double(st, col);
}

std::optional<std::int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (ColNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

std::vector<std::int32_t> ToYears(const std::vector<std::int64_t>& values) {
  return {values.begin(), values.end()};
}

model::CollaborationRecord ReadCollaboration(sqlite3_stmt* st) {
  model::CollaborationRecord r;
  r.pair                = {ColI64(st, 0), ColI64(st, 1)};
  r.collaboration_count = ColI64(st, 2);
  r.first_year          = ColI32(st, 3);
  r.last_year           = ColI32(st, 4);
  r.avg_rating          = ColOptDouble(st, 5);
  r.total_revenue       = ColI64(st, 6);
  r.types               = model::TypeSet(static_cast<std::uint32_t>(ColI64(st, 7)));
  r.years_active        = ToYears(sql::SplitInts(ColText(st, 8)));
  r.peak_year           = ColI32(st, 9);
  r.genre_diversity     = sqlite3_column_double(st, 10);
  r.role_diversity      = sqlite3_column_double(st, 11);
  r.updated_at_ms       = ColU64(st, 12);
  return r;
}

model::CollaborationDetailRecord ReadDetail(sqlite3_stmt* st) {
  model::CollaborationDetailRecord r;
  r.pair      = {ColI64(st, 0), ColI64(st, 1)};
  r.work_id   = ColI64(st, 2);
  r.type      = static_cast<model::CollaborationType>(ColI32(st, 3));
  r.low_role  = static_cast<model::RoleKind>(ColI32(st, 4));
  r.high_role = static_cast<model::RoleKind>(ColI32(st, 5));
  r.year      = ColI32(st, 6);
  r.rating    = ColOptDouble(st, 7);
  r.revenue   = ColOptI64(st, 8);
  r.genres    = sql::DecodeStringList(ColText(st, 9));
  return r;
}

std::vector<model::CollaborationDetailRecord> ReadDetails(Statement& st) {
  std::vector<model::CollaborationDetailRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadDetail(st.get()));
  }
  return out;
}

std::uint64_t Count(sqlite3* db, const char* sql) {
  Statement st(db, sql);
  if (st.Step() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWork(Transaction& t, const model::WorkRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO works(work_id,release_year,rating,revenue,genres) VALUES(?,?,?,?,?) "
               "ON CONFLICT(work_id) DO UPDATE SET release_year=excluded.release_year,rating=excluded.rating,"
               "revenue=excluded.revenue,genres=excluded.genres;");
  BindI64(st.get(), 1, r.work_id);
  BindI64(st.get(), 2, r.release_year);
  BindOptional(st.get(), 3, r.rating);
  BindOptional(st.get(), 4, r.revenue);
  BindText(st.get(), 5, sql::EncodeStringList(r.genres));
  return st.Run();
}

std::optional<model::WorkRecord> SqliteRepository::GetWork(Transaction& t, model::WorkId work_id) {
  Statement st(TX(t).Handle(), "SELECT work_id,release_year,rating,revenue,genres FROM works WHERE work_id=?;");
  BindI64(st.get(), 1, work_id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::WorkRecord r;
  r.work_id      = ColI64(st.get(), 0);
  r.release_year = ColI32(st.get(), 1);
  r.rating       = ColOptDouble(st.get(), 2);
  r.revenue      = ColOptI64(st.get(), 3);
  r.genres       = sql::DecodeStringList(ColText(st.get(), 4));
  return r;
}

std::vector<model::WorkId> SqliteRepository::ListWorkIds(Transaction& t) {
  Statement                  st(TX(t).Handle(), "SELECT work_id FROM works ORDER BY work_id;");
  std::vector<model::WorkId> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ColI64(st.get(), 0));
  }
  return out;
}

Result SqliteRepository::ReplaceCredits(Transaction& t, model::WorkId work_id, const std::vector<model::CreditRecord>& credits) {
  auto* db = TX(t).Handle();

  {
    Statement exists(db, "SELECT 1 FROM works WHERE work_id=?;");
    BindI64(exists.get(), 1, work_id);
    if (exists.Step() != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "unknown work " + std::to_string(work_id));
  }

  {
    Statement del(db, "DELETE FROM credits WHERE work_id=?;");
    BindI64(del.get(), 1, work_id);
    if (auto res = del.Run(); !res) return res;
  }

  for (const auto& c : credits) {
    Statement st(db, "INSERT INTO credits(work_id,person_id,role_kind,role_name,billing_ordinal) VALUES(?,?,?,?,?);");
    BindI64(st.get(), 1, work_id);
    BindOptional(st.get(), 2, c.person_id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(c.role_kind));
    BindText(st.get(), 4, c.role_name);
    BindOptional(st.get(), 5, c.billing_ordinal);
    if (auto res = st.Run(); !res) return res;
  }
  return Result::Ok();
}

std::vector<model::CreditRecord> SqliteRepository::ListCredits(Transaction& t, model::WorkId work_id) {
  Statement st(TX(t).Handle(),
               "SELECT work_id,person_id,role_kind,role_name,billing_ordinal FROM credits WHERE work_id=? "
               "ORDER BY person_id,role_kind,role_name,billing_ordinal;");
  BindI64(st.get(), 1, work_id);

  std::vector<model::CreditRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::CreditRecord c;
    c.work_id   = ColI64(st.get(), 0);
    c.person_id = ColOptI64(st.get(), 1);
    c.role_kind = static_cast<model::RoleKind>(ColI32(st.get(), 2));
    c.role_name = ColText(st.get(), 3);
    if (!ColNull(st.get(), 4)) c.billing_ordinal = ColI32(st.get(), 4);
    out.push_back(std::move(c));
  }
  return out;
}

bool SqliteRepository::PersonExists(Transaction& t, model::PersonId person) {
  Statement st(TX(t).Handle(), "SELECT 1 FROM credits WHERE person_id=? LIMIT 1;");
  BindI64(st.get(), 1, person);
  return st.Step() == SQLITE_ROW;
}

// ------------------------------------------------------------------
// Collaboration pairs
// ------------------------------------------------------------------

Result SqliteRepository::LockPair(Transaction&, const model::PersonPair& pair) {
  // BEGIN IMMEDIATE already holds the database write lock
  if (!pair.IsCanonical()) return Result::Err(ErrorCode::ConstraintViolation, "pair must be stored low < high");
  return Result::Ok();
}

Result SqliteRepository::UpsertCollaboration(Transaction& t, const model::CollaborationRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO collaborations(person_low_id,person_high_id,collaboration_count,first_year,last_year,"
               "avg_rating,total_revenue,types,years_active,peak_year,genre_diversity,role_diversity,updated_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(person_low_id,person_high_id) DO UPDATE SET "
               "collaboration_count=excluded.collaboration_count,first_year=excluded.first_year,"
               "last_year=excluded.last_year,avg_rating=excluded.avg_rating,total_revenue=excluded.total_revenue,"
               "types=excluded.types,years_active=excluded.years_active,peak_year=excluded.peak_year,"
               "genre_diversity=excluded.genre_diversity,role_diversity=excluded.role_diversity,"
               "updated_at_ms=excluded.updated_at_ms;");
  auto* s = st.get();
  BindPair(s, 1, r.pair);
  BindI64(s, 3, r.collaboration_count);
  BindI64(s, 4, r.first_year);
  BindI64(s, 5, r.last_year);
  BindOptional(s, 6, r.avg_rating);
  BindI64(s, 7, r.total_revenue);
  BindI64(s, 8, r.types.Bits());
  BindText(s, 9, sql::JoinInts(std::vector<std::int64_t>(r.years_active.begin(), r.years_active.end())));
  BindI64(s, 10, r.peak_year);
  BindDouble(s, 11, r.genre_diversity);
  BindDouble(s, 12, r.role_diversity);
  BindU64(s, 13, r.updated_at_ms);
  return st.Run();
}

std::optional<model::CollaborationRecord> SqliteRepository::GetCollaboration(Transaction& t, const model::PersonPair& pair) {
  const std::string sql = std::string("SELECT ") + kCollaborationColumns +
                          " FROM collaborations WHERE person_low_id=? AND person_high_id=?;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindPair(st.get(), 1, pair);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadCollaboration(st.get());
}

std::vector<model::CollaborationRecord> SqliteRepository::ListCollaborationsForPerson(Transaction& t, model::PersonId person) {
  const std::string sql = std::string("SELECT ") + kCollaborationColumns +
                          " FROM collaborations WHERE person_low_id=?1 OR person_high_id=?1"
                          " ORDER BY person_low_id,person_high_id;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindI64(st.get(), 1, person);

  std::vector<model::CollaborationRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadCollaboration(st.get()));
  }
  return out;
}

std::vector<model::CollaborationRecord> SqliteRepository::ListAllCollaborations(Transaction& t) {
  const std::string sql = std::string("SELECT ") + kCollaborationColumns + " FROM collaborations ORDER BY person_low_id,person_high_id;";
  Statement         st(TX(t).Handle(), sql.c_str());

  std::vector<model::CollaborationRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadCollaboration(st.get()));
  }
  return out;
}

NeighborMap SqliteRepository::ListNeighbors(Transaction& t, const std::vector<model::PersonId>& frontier) {
  NeighborMap                           out;
  const std::unordered_set<model::PersonId> wanted(frontier.begin(), frontier.end());

  for (std::size_t begin = 0; begin < frontier.size(); begin += kInListChunk) {
    const auto        ids = sql::InList(frontier, begin, begin + kInListChunk);
    const std::string sql = "SELECT person_low_id,person_high_id FROM collaborations WHERE person_low_id IN (" + ids +
                            ") UNION ALL SELECT person_low_id,person_high_id FROM collaborations WHERE person_high_id IN (" +
                            ids + ");";
    Statement st(TX(t).Handle(), sql.c_str());
    while (st.Step() == SQLITE_ROW) {
      const auto low  = ColI64(st.get(), 0);
      const auto high = ColI64(st.get(), 1);
      if (wanted.contains(low)) out[low].push_back(high);
      if (wanted.contains(high)) out[high].push_back(low);
    }
  }

  for (auto& [_, neighbors] : out) {
    std::sort(neighbors.begin(), neighbors.end());
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
  }
  return out;
}

Result SqliteRepository::DeleteAllCollaborations(Transaction& t) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, "DELETE FROM collaboration_details;");
    if (auto res = st.Run(); !res) return res;
  }
  Statement st(db, "DELETE FROM collaborations;");
  return st.Run();
}

// ------------------------------------------------------------------
// Details
// ------------------------------------------------------------------

Result SqliteRepository::InsertDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO collaboration_details(person_low_id,person_high_id,work_id,collaboration_type,low_role,"
               "high_role,release_year,rating,revenue,genres) VALUES(?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(person_low_id,person_high_id,work_id) DO NOTHING;");
  auto* s = st.get();
  BindPair(s, 1, r.pair);
  BindI64(s, 3, r.work_id);
  BindI64(s, 4, static_cast<std::int64_t>(r.type));
  BindI64(s, 5, static_cast<std::int64_t>(r.low_role));
  BindI64(s, 6, static_cast<std::int64_t>(r.high_role));
  BindI64(s, 7, r.year);
  BindOptional(s, 8, r.rating);
  BindOptional(s, 9, r.revenue);
  BindText(s, 10, sql::EncodeStringList(r.genres));

  if (auto res = st.Run(); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

Result SqliteRepository::UpdateDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE collaboration_details SET collaboration_type=?,low_role=?,high_role=?,release_year=?,rating=?,"
               "revenue=?,genres=? WHERE person_low_id=? AND person_high_id=? AND work_id=?;");
  auto* s = st.get();
  BindI64(s, 1, static_cast<std::int64_t>(r.type));
  BindI64(s, 2, static_cast<std::int64_t>(r.low_role));
  BindI64(s, 3, static_cast<std::int64_t>(r.high_role));
  BindI64(s, 4, r.year);
  BindOptional(s, 5, r.rating);
  BindOptional(s, 6, r.revenue);
  BindText(s, 7, sql::EncodeStringList(r.genres));
  BindPair(s, 8, r.pair);
  BindI64(s, 10, r.work_id);

  if (auto res = st.Run(); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::CollaborationDetailRecord> SqliteRepository::GetDetail(Transaction& t, const model::PersonPair& pair, model::WorkId work_id) {
  const std::string sql = std::string("SELECT ") + kDetailColumns +
                          " FROM collaboration_details WHERE person_low_id=? AND person_high_id=? AND work_id=?;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindPair(st.get(), 1, pair);
  BindI64(st.get(), 3, work_id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadDetail(st.get());
}

std::vector<model::CollaborationDetailRecord> SqliteRepository::ListDetailsForPair(Transaction& t, const model::PersonPair& pair) {
  const std::string sql = std::string("SELECT ") + kDetailColumns +
                          " FROM collaboration_details WHERE person_low_id=? AND person_high_id=? ORDER BY work_id;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindPair(st.get(), 1, pair);
  return ReadDetails(st);
}

std::vector<model::CollaborationDetailRecord> SqliteRepository::ListDetailsForPerson(Transaction& t, model::PersonId person) {
  const std::string sql = std::string("SELECT ") + kDetailColumns +
                          " FROM collaboration_details WHERE person_low_id=?1 OR person_high_id=?1"
                          " ORDER BY person_low_id,person_high_id,work_id;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindI64(st.get(), 1, person);
  return ReadDetails(st);
}

std::vector<model::CollaborationDetailRecord> SqliteRepository::ListAllDetails(Transaction& t) {
  const std::string sql = std::string("SELECT ") + kDetailColumns +
                          " FROM collaboration_details ORDER BY person_low_id,person_high_id,work_id;";
  Statement st(TX(t).Handle(), sql.c_str());
  return ReadDetails(st);
}

// ------------------------------------------------------------------
// Path cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPathCache(Transaction& t, const model::PathCacheRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO path_cache(person_low_id,person_high_id,path,path_length,computed_at_ms) VALUES(?,?,?,?,?) "
               "ON CONFLICT(person_low_id,person_high_id) DO UPDATE SET path=excluded.path,"
               "path_length=excluded.path_length,computed_at_ms=excluded.computed_at_ms;");
  BindPair(st.get(), 1, r.pair);
  BindText(st.get(), 3, sql::JoinInts(r.path));
  BindI64(st.get(), 4, r.path_length);
  BindU64(st.get(), 5, r.computed_at_ms);
  return st.Run();
}

std::optional<model::PathCacheRecord> SqliteRepository::GetPathCache(Transaction& t, const model::PersonPair& pair) {
  Statement st(TX(t).Handle(),
               "SELECT person_low_id,person_high_id,path,path_length,computed_at_ms FROM path_cache "
               "WHERE person_low_id=? AND person_high_id=?;");
  BindPair(st.get(), 1, pair);

  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::PathCacheRecord r;
  r.pair           = {ColI64(st.get(), 0), ColI64(st.get(), 1)};
  r.path           = sql::SplitInts(ColText(st.get(), 2));
  r.path_length    = ColI32(st.get(), 3);
  r.computed_at_ms = ColU64(st.get(), 4);
  return r;
}

Result SqliteRepository::DeleteExpiredPathCache(Transaction& t, std::uint64_t cutoff_ms) {
  Statement st(TX(t).Handle(), "DELETE FROM path_cache WHERE computed_at_ms < ?;");
  BindU64(st.get(), 1, cutoff_ms);
  return st.Run();
}

// ------------------------------------------------------------------
// Trends
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceTrendSnapshot(Transaction& t, const std::vector<model::TrendRecord>& rows) {
  auto* db = TX(t).Handle();
  {
    Statement del(db, "DELETE FROM trend_snapshot;");
    if (auto res = del.Run(); !res) return res;
  }

  for (const auto& r : rows) {
    Statement st(db,
                 "INSERT INTO trend_snapshot(person_low_id,person_high_id,trend_score,recent_count,baseline_count,"
                 "last_year,refreshed_at_ms) VALUES(?,?,?,?,?,?,?);");
    BindPair(st.get(), 1, r.pair);
    BindDouble(st.get(), 3, r.trend_score);
    BindI64(st.get(), 4, r.recent_count);
    BindI64(st.get(), 5, r.baseline_count);
    BindI64(st.get(), 6, r.last_year);
    BindU64(st.get(), 7, r.refreshed_at_ms);
    if (auto res = st.Run(); !res) return res;
  }
  return Result::Ok();
}

std::vector<model::TrendRecord> SqliteRepository::ListTrending(Transaction& t, std::size_t limit) {
  Statement st(TX(t).Handle(),
               "SELECT person_low_id,person_high_id,trend_score,recent_count,baseline_count,last_year,refreshed_at_ms "
               "FROM trend_snapshot ORDER BY trend_score DESC,recent_count DESC,person_low_id,person_high_id LIMIT ?;");
  BindU64(st.get(), 1, limit);

  std::vector<model::TrendRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::TrendRecord r;
    r.pair            = {ColI64(st.get(), 0), ColI64(st.get(), 1)};
    r.trend_score     = sqlite3_column_double(st.get(), 2);
    r.recent_count    = ColI64(st.get(), 3);
    r.baseline_count  = ColI64(st.get(), 4);
    r.last_year       = ColI32(st.get(), 5);
    r.refreshed_at_ms = ColU64(st.get(), 6);
    out.push_back(r);
  }
  return out;
}

model::GraphCounts SqliteRepository::CountRows(Transaction& t) {
  auto*              db = TX(t).Handle();
  model::GraphCounts counts;
  counts.works          = Count(db, "SELECT COUNT(*) FROM works;");
  counts.credits        = Count(db, "SELECT COUNT(*) FROM credits;");
  counts.collaborations = Count(db, "SELECT COUNT(*) FROM collaborations;");
  counts.details        = Count(db, "SELECT COUNT(*) FROM collaboration_details;");
  counts.cached_paths   = Count(db, "SELECT COUNT(*) FROM path_cache;");
  counts.trend_rows     = Count(db, "SELECT COUNT(*) FROM trend_snapshot;");
  return counts;
}

} // namespace collab::db::sqlite
