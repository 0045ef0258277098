#include "pg_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/db/sql/sql_codec.hpp"

namespace collab::db::postgres {

namespace {

constexpr std::size_t kInListChunk = 500;

constexpr const char* kDetailSelect =
    "SELECT person_low_id,person_high_id,work_id,collaboration_type,low_role,high_role,release_year,rating,revenue,"
    "genres FROM collaboration_details ";

constexpr const char* kCollaborationSelect =
    "SELECT person_low_id,person_high_id,collaboration_count,first_year,last_year,avg_rating,total_revenue,types,"
    "years_active,peak_year,genre_diversity,role_diversity,updated_at_ms FROM collaborations ";

// Reads hand back values, so backend failures leave as DbError.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DbError&) {
    throw;
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

template <typename Fn>
Result Write(Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<double> OptDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

std::optional<std::int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::int64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::CollaborationRecord ReadCollaboration(const pqxx::row& row) {
  model::CollaborationRecord r;
  r.pair                = {row[0].as<std::int64_t>(), row[1].as<std::int64_t>()};
  r.collaboration_count = row[2].as<std::int64_t>();
  r.first_year          = row[3].as<std::int32_t>();
  r.last_year           = row[4].as<std::int32_t>();
  r.avg_rating          = OptDouble(row[5]);
  r.total_revenue       = row[6].as<std::int64_t>();
  r.types               = model::TypeSet(static_cast<std::uint32_t>(row[7].as<std::int64_t>()));
  const auto years      = sql::SplitInts(Text(row[8]));
  r.years_active.assign(years.begin(), years.end());
  r.peak_year       = row[9].as<std::int32_t>();
  r.genre_diversity = row[10].as<double>();
  r.role_diversity  = row[11].as<double>();
  r.updated_at_ms   = row[12].as<std::uint64_t>();
  return r;
}

model::CollaborationDetailRecord ReadDetail(const pqxx::row& row) {
  model::CollaborationDetailRecord r;
  r.pair      = {row[0].as<std::int64_t>(), row[1].as<std::int64_t>()};
  r.work_id   = row[2].as<std::int64_t>();
  r.type      = static_cast<model::CollaborationType>(row[3].as<int>());
  r.low_role  = static_cast<model::RoleKind>(row[4].as<int>());
  r.high_role = static_cast<model::RoleKind>(row[5].as<int>());
  r.year      = row[6].as<std::int32_t>();
  r.rating    = OptDouble(row[7]);
  r.revenue   = OptI64(row[8]);
  r.genres    = sql::DecodeStringList(Text(row[9]));
  return r;
}

std::vector<model::CollaborationDetailRecord> ReadDetails(const pqxx::result& res) {
  std::vector<model::CollaborationDetailRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDetail(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertWork(Transaction& t, const model::WorkRecord& r) {
  return Write([&] {
    TX(t).Work().exec_params(
        "INSERT INTO works(work_id,release_year,rating,revenue,genres) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(work_id) DO UPDATE SET release_year=EXCLUDED.release_year,rating=EXCLUDED.rating,"
        "revenue=EXCLUDED.revenue,genres=EXCLUDED.genres;",
        r.work_id, r.release_year, r.rating, r.revenue, sql::EncodeStringList(r.genres));
    return Result::Ok();
  });
}

std::optional<model::WorkRecord> PgRepository::GetWork(Transaction& t, model::WorkId work_id) {
  return Read([&]() -> std::optional<model::WorkRecord> {
    auto res = TX(t).Work().exec_prepared("get_work", work_id);
    if (res.empty()) return std::nullopt;

    model::WorkRecord r;
    r.work_id      = res[0][0].as<std::int64_t>();
    r.release_year = res[0][1].as<std::int32_t>();
    r.rating       = OptDouble(res[0][2]);
    r.revenue      = OptI64(res[0][3]);
    r.genres       = sql::DecodeStringList(Text(res[0][4]));
    return r;
  });
}

std::vector<model::WorkId> PgRepository::ListWorkIds(Transaction& t) {
  return Read([&] {
    auto                       res = TX(t).Work().exec("SELECT work_id FROM works ORDER BY work_id;");
    std::vector<model::WorkId> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(row[0].as<std::int64_t>());
    }
    return out;
  });
}

Result PgRepository::ReplaceCredits(Transaction& t, model::WorkId work_id, const std::vector<model::CreditRecord>& credits) {
  return Write([&] {
    auto& w = TX(t).Work();
    if (w.exec_params("SELECT 1 FROM works WHERE work_id=$1;", work_id).empty()) {
      return Result::Err(ErrorCode::NotFound, "unknown work " + std::to_string(work_id));
    }

    w.exec_params("DELETE FROM credits WHERE work_id=$1;", work_id);
    for (const auto& c : credits) {
      w.exec_params("INSERT INTO credits(work_id,person_id,role_kind,role_name,billing_ordinal) VALUES($1,$2,$3,$4,$5);",
                    work_id, c.person_id, static_cast<int>(c.role_kind), c.role_name, c.billing_ordinal);
    }
    return Result::Ok();
  });
}

std::vector<model::CreditRecord> PgRepository::ListCredits(Transaction& t, model::WorkId work_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT work_id,person_id,role_kind,role_name,billing_ordinal FROM credits WHERE work_id=$1 "
        "ORDER BY person_id NULLS FIRST,role_kind,role_name COLLATE \"C\",billing_ordinal NULLS FIRST;",
        work_id);

    std::vector<model::CreditRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::CreditRecord c;
      c.work_id   = row[0].as<std::int64_t>();
      c.person_id = OptI64(row[1]);
      c.role_kind = static_cast<model::RoleKind>(row[2].as<int>());
      c.role_name = Text(row[3]);
      if (!row[4].is_null()) c.billing_ordinal = row[4].as<std::int32_t>();
      out.push_back(std::move(c));
    }
    return out;
  });
}

bool PgRepository::PersonExists(Transaction& t, model::PersonId person) {
  return Read([&] { return !TX(t).Work().exec_prepared("person_exists", person).empty(); });
}

// ------------------------------------------------------------------
// Collaboration pairs
// ------------------------------------------------------------------

Result PgRepository::LockPair(Transaction& t, const model::PersonPair& pair) {
  if (!pair.IsCanonical()) return Result::Err(ErrorCode::ConstraintViolation, "pair must be stored low < high");
  return Write([&] {
    TX(t).Work().exec_prepared("lock_pair", pair.low, pair.high);
    return Result::Ok();
  });
}

Result PgRepository::UpsertCollaboration(Transaction& t, const model::CollaborationRecord& r) {
  return Write([&] {
    const std::vector<std::int64_t> years(r.years_active.begin(), r.years_active.end());
    TX(t).Work().exec_params(
        "INSERT INTO collaborations(person_low_id,person_high_id,collaboration_count,first_year,last_year,"
        "avg_rating,total_revenue,types,years_active,peak_year,genre_diversity,role_diversity,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13) "
        "ON CONFLICT(person_low_id,person_high_id) DO UPDATE SET "
        "collaboration_count=EXCLUDED.collaboration_count,first_year=EXCLUDED.first_year,"
        "last_year=EXCLUDED.last_year,avg_rating=EXCLUDED.avg_rating,total_revenue=EXCLUDED.total_revenue,"
        "types=EXCLUDED.types,years_active=EXCLUDED.years_active,peak_year=EXCLUDED.peak_year,"
        "genre_diversity=EXCLUDED.genre_diversity,role_diversity=EXCLUDED.role_diversity,"
        "updated_at_ms=EXCLUDED.updated_at_ms;",
        r.pair.low, r.pair.high, r.collaboration_count, r.first_year, r.last_year, r.avg_rating, r.total_revenue,
        static_cast<std::int64_t>(r.types.Bits()), sql::JoinInts(years), r.peak_year, r.genre_diversity,
        r.role_diversity, static_cast<std::int64_t>(r.updated_at_ms));
    return Result::Ok();
  });
}

std::optional<model::CollaborationRecord> PgRepository::GetCollaboration(Transaction& t, const model::PersonPair& pair) {
  return Read([&]() -> std::optional<model::CollaborationRecord> {
    auto res = TX(t).Work().exec_prepared("get_collaboration", pair.low, pair.high);
    if (res.empty()) return std::nullopt;
    return ReadCollaboration(res[0]);
  });
}

std::vector<model::CollaborationRecord> PgRepository::ListCollaborationsForPerson(Transaction& t, model::PersonId person) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(std::string(kCollaborationSelect) +
                                            "WHERE person_low_id=$1 OR person_high_id=$1 "
                                            "ORDER BY person_low_id,person_high_id;",
                                        person);
    std::vector<model::CollaborationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadCollaboration(row));
    }
    return out;
  });
}

std::vector<model::CollaborationRecord> PgRepository::ListAllCollaborations(Transaction& t) {
  return Read([&] {
    auto res = TX(t).Work().exec(std::string(kCollaborationSelect) + "ORDER BY person_low_id,person_high_id;");
    std::vector<model::CollaborationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadCollaboration(row));
    }
    return out;
  });
}

NeighborMap PgRepository::ListNeighbors(Transaction& t, const std::vector<model::PersonId>& frontier) {
  return Read([&] {
    NeighborMap                               out;
    const std::unordered_set<model::PersonId> wanted(frontier.begin(), frontier.end());

    for (std::size_t begin = 0; begin < frontier.size(); begin += kInListChunk) {
      const auto ids = sql::InList(frontier, begin, begin + kInListChunk);
      auto       res = TX(t).Work().exec(
          "SELECT person_low_id,person_high_id FROM collaborations WHERE person_low_id IN (" + ids +
          ") UNION ALL SELECT person_low_id,person_high_id FROM collaborations WHERE person_high_id IN (" + ids + ");");
      for (const auto& row : res) {
        const auto low  = row[0].as<std::int64_t>();
        const auto high = row[1].as<std::int64_t>();
        if (wanted.contains(low)) out[low].push_back(high);
        if (wanted.contains(high)) out[high].push_back(low);
      }
    }

    for (auto& [_, neighbors] : out) {
      std::sort(neighbors.begin(), neighbors.end());
      neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    }
    return out;
  });
}

Result PgRepository::DeleteAllCollaborations(Transaction& t) {
  return Write([&] {
    TX(t).Work().exec("DELETE FROM collaboration_details;");
    TX(t).Work().exec("DELETE FROM collaborations;");
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Details
// ------------------------------------------------------------------

Result PgRepository::InsertDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  return Write([&] {
    auto res = TX(t).Work().exec_prepared("insert_detail", r.pair.low, r.pair.high, r.work_id, static_cast<int>(r.type),
                                          static_cast<int>(r.low_role), static_cast<int>(r.high_role), r.year, r.rating,
                                          r.revenue, sql::EncodeStringList(r.genres));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  });
}

Result PgRepository::UpdateDetail(Transaction& t, const model::CollaborationDetailRecord& r) {
  return Write([&] {
    auto res = TX(t).Work().exec_params(
        "UPDATE collaboration_details SET collaboration_type=$4,low_role=$5,high_role=$6,release_year=$7,rating=$8,"
        "revenue=$9,genres=$10 WHERE person_low_id=$1 AND person_high_id=$2 AND work_id=$3;",
        r.pair.low, r.pair.high, r.work_id, static_cast<int>(r.type), static_cast<int>(r.low_role),
        static_cast<int>(r.high_role), r.year, r.rating, r.revenue, sql::EncodeStringList(r.genres));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  });
}

std::optional<model::CollaborationDetailRecord> PgRepository::GetDetail(Transaction& t, const model::PersonPair& pair, model::WorkId work_id) {
  return Read([&]() -> std::optional<model::CollaborationDetailRecord> {
    auto res = TX(t).Work().exec_prepared("get_detail", pair.low, pair.high, work_id);
    if (res.empty()) return std::nullopt;
    return ReadDetail(res[0]);
  });
}

std::vector<model::CollaborationDetailRecord> PgRepository::ListDetailsForPair(Transaction& t, const model::PersonPair& pair) {
  return Read([&] {
    return ReadDetails(TX(t).Work().exec_params(
        std::string(kDetailSelect) + "WHERE person_low_id=$1 AND person_high_id=$2 ORDER BY work_id;", pair.low, pair.high));
  });
}

std::vector<model::CollaborationDetailRecord> PgRepository::ListDetailsForPerson(Transaction& t, model::PersonId person) {
  return Read([&] {
    return ReadDetails(TX(t).Work().exec_params(std::string(kDetailSelect) +
                                                    "WHERE person_low_id=$1 OR person_high_id=$1 "
                                                    "ORDER BY person_low_id,person_high_id,work_id;",
                                                person));
  });
}

std::vector<model::CollaborationDetailRecord> PgRepository::ListAllDetails(Transaction& t) {
  return Read([&] {
    return ReadDetails(
        TX(t).Work().exec(std::string(kDetailSelect) + "ORDER BY person_low_id,person_high_id,work_id;"));
  });
}

// ------------------------------------------------------------------
// Path cache
// ------------------------------------------------------------------

Result PgRepository::UpsertPathCache(Transaction& t, const model::PathCacheRecord& r) {
  return Write([&] {
    TX(t).Work().exec_params(
        "INSERT INTO path_cache(person_low_id,person_high_id,path,path_length,computed_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(person_low_id,person_high_id) DO UPDATE SET path=EXCLUDED.path,"
        "path_length=EXCLUDED.path_length,computed_at_ms=EXCLUDED.computed_at_ms;",
        r.pair.low, r.pair.high, sql::JoinInts(r.path), r.path_length, static_cast<std::int64_t>(r.computed_at_ms));
    return Result::Ok();
  });
}

std::optional<model::PathCacheRecord> PgRepository::GetPathCache(Transaction& t, const model::PersonPair& pair) {
  return Read([&]() -> std::optional<model::PathCacheRecord> {
    auto res = TX(t).Work().exec_prepared("get_path_cache", pair.low, pair.high);
    if (res.empty()) return std::nullopt;

    model::PathCacheRecord r;
    r.pair           = {res[0][0].as<std::int64_t>(), res[0][1].as<std::int64_t>()};
    r.path           = sql::SplitInts(Text(res[0][2]));
    r.path_length    = res[0][3].as<std::int32_t>();
    r.computed_at_ms = res[0][4].as<std::uint64_t>();
    return r;
  });
}

Result PgRepository::DeleteExpiredPathCache(Transaction& t, std::uint64_t cutoff_ms) {
  return Write([&] {
    TX(t).Work().exec_params("DELETE FROM path_cache WHERE computed_at_ms < $1;", static_cast<std::int64_t>(cutoff_ms));
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Trends
// ------------------------------------------------------------------

Result PgRepository::ReplaceTrendSnapshot(Transaction& t, const std::vector<model::TrendRecord>& rows) {
  return Write([&] {
    auto& w = TX(t).Work();
    w.exec("DELETE FROM trend_snapshot;");
    for (const auto& r : rows) {
      w.exec_params(
          "INSERT INTO trend_snapshot(person_low_id,person_high_id,trend_score,recent_count,baseline_count,last_year,"
          "refreshed_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7);",
          r.pair.low, r.pair.high, r.trend_score, r.recent_count, r.baseline_count, r.last_year,
          static_cast<std::int64_t>(r.refreshed_at_ms));
    }
    return Result::Ok();
  });
}

std::vector<model::TrendRecord> PgRepository::ListTrending(Transaction& t, std::size_t limit) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT person_low_id,person_high_id,trend_score,recent_count,baseline_count,last_year,refreshed_at_ms "
        "FROM trend_snapshot ORDER BY trend_score DESC,recent_count DESC,person_low_id,person_high_id LIMIT $1;",
        static_cast<std::int64_t>(limit));

    std::vector<model::TrendRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::TrendRecord r;
      r.pair            = {row[0].as<std::int64_t>(), row[1].as<std::int64_t>()};
      r.trend_score     = row[2].as<double>();
      r.recent_count    = row[3].as<std::int64_t>();
      r.baseline_count  = row[4].as<std::int64_t>();
      r.last_year       = row[5].as<std::int32_t>();
      r.refreshed_at_ms = row[6].as<std::uint64_t>();
      out.push_back(r);
    }
    return out;
  });
}

model::GraphCounts PgRepository::CountRows(Transaction& t) {
  return Read([&] {
    auto res = TX(t).Work().exec(
        "SELECT (SELECT COUNT(*) FROM works),(SELECT COUNT(*) FROM credits),(SELECT COUNT(*) FROM collaborations),"
        "(SELECT COUNT(*) FROM collaboration_details),(SELECT COUNT(*) FROM path_cache),"
        "(SELECT COUNT(*) FROM trend_snapshot);");

    model::GraphCounts counts;
    counts.works          = res[0][0].as<std::uint64_t>();
    counts.credits        = res[0][1].as<std::uint64_t>();
    counts.collaborations = res[0][2].as<std::uint64_t>();
    counts.details        = res[0][3].as<std::uint64_t>();
    counts.cached_paths   = res[0][4].as<std::uint64_t>();
    counts.trend_rows     = res[0][5].as<std::uint64_t>();
    return counts;
  });
}

} // namespace collab::db::postgres
