#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/graph/aggregate_store.hpp"
#include "internal/graph/aggregates.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/population/apply_worker_pool.hpp"
#include "support/fixtures.hpp"

#if COLLAB_DB_POSTGRES
#include <pqxx/pqxx>
#endif

namespace {

using collab::db::Repository;
using collab::db::memory::MemoryRepository;
using collab::db::model::CollaborationDetailRecord;
using collab::db::model::CollaborationRecord;
using collab::db::model::PathCacheRecord;
using collab::db::model::TrendRecord;
using collab::model::CollaborationType;
using collab::model::PersonId;
using collab::model::PersonPair;
using collab::model::RoleKind;
using namespace collab::testing;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

CollaborationDetailRecord Detail(PersonPair pair, collab::model::WorkId work_id, std::int32_t year) {
  CollaborationDetailRecord detail;
  detail.pair      = pair;
  detail.work_id   = work_id;
  detail.type      = CollaborationType::kPerformerDirector;
  detail.low_role  = RoleKind::kDirector;
  detail.high_role = RoleKind::kPerformer;
  detail.year      = year;
  detail.rating    = 7.5;
  detail.genres    = {"Drama", "War"};
  return detail;
}

void VerifyCatalogReadWrite(Repository& repo) {
  auto missing_person      = Crew(101, 0, "Editor");
  missing_person.person_id = std::nullopt;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertWork(*tx, Work(102, 1999)));
    assert(repo.UpsertWork(*tx, Work(101, 2004, 6.5, 1200, {"Drama", "Crime"})));
    assert(repo.ReplaceCredits(*tx, 101, {Performer(101, 11, 2), Director(101, 10), missing_person, Performer(101, 11, 7)}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  const auto work = repo.GetWork(*tx, 101);
  assert(work.has_value());
  assert(work->release_year == 2004);
  assert(work->rating == 6.5);
  assert(work->revenue == 1200);
  assert((work->genres == std::vector<std::string>{"Drama", "Crime"}));

  const auto bare = repo.GetWork(*tx, 102);
  assert(bare.has_value());
  assert(!bare->rating.has_value());
  assert(!bare->revenue.has_value());
  assert(bare->genres.empty());

  assert(!repo.GetWork(*tx, 999).has_value());
  assert((repo.ListWorkIds(*tx) == std::vector<collab::model::WorkId>{101, 102}));

  const auto credits = repo.ListCredits(*tx, 101);
  assert(credits.size() == 4);
  assert(!credits[0].person_id.has_value());
  assert(credits[0].role_name == "Editor");
  assert(credits[1].person_id == 10);
  assert(credits[1].role_kind == RoleKind::kDirector);
  assert(credits[2].billing_ordinal == 2);
  assert(credits[3].billing_ordinal == 7);

  assert(repo.PersonExists(*tx, 10));
  assert(repo.PersonExists(*tx, 11));
  assert(!repo.PersonExists(*tx, 12));

  // credits of an unknown work are refused
  assert(!repo.ReplaceCredits(*tx, 999, {Performer(999, 1, 1)}));
  tx->Rollback();

  {
    auto replace = repo.Begin();
    assert(repo.ReplaceCredits(*replace, 101, {Director(101, 12)}));
    replace->Commit();
  }

  auto after = repo.Begin();
  assert(repo.ListCredits(*after, 101).size() == 1);
  assert(!repo.PersonExists(*after, 10));
  assert(repo.PersonExists(*after, 12));
  after->Commit();
}

// Tags are free text: separators, quotes and empty tags survive a round trip
// through every backend, on both the work row and the detail row.
void VerifyGenreTagsKeptVerbatim(Repository& repo) {
  const std::vector<std::string> tags{"Action,Adventure", "", "Sci \"Fi\"", "Drama"};
  const PersonPair               pair{151, 152};

  {
    auto tx = repo.Begin();
    assert(repo.UpsertWork(*tx, Work(150, 2012, std::nullopt, std::nullopt, tags)));
    assert(repo.UpsertWork(*tx, Work(149, 2012, std::nullopt, std::nullopt, {""})));
    auto detail   = Detail(pair, 150, 2012);
    detail.genres = tags;
    assert(repo.InsertDetail(*tx, detail));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetWork(*tx, 150)->genres == tags);
  assert((repo.GetWork(*tx, 149)->genres == std::vector<std::string>{""}));
  const auto detail = repo.GetDetail(*tx, pair, 150);
  assert(detail.has_value());
  assert(detail->genres == tags);
  tx->Commit();

  auto clear = repo.Begin();
  assert(repo.DeleteAllCollaborations(*clear));
  clear->Commit();
}

void VerifyPairReadWrite(Repository& repo) {
  CollaborationRecord record;
  record.pair                = PersonPair{201, 202};
  record.collaboration_count = 2;
  record.first_year          = 1990;
  record.last_year           = 1995;
  record.avg_rating          = 8.25;
  record.total_revenue       = 5000;
  record.types.Add(CollaborationType::kPerformerDirector);
  record.types.Add(CollaborationType::kCrewCrew);
  record.years_active    = {1990, 1995};
  record.peak_year       = 1990;
  record.genre_diversity = 0.3;
  record.role_diversity  = 0.4;
  record.updated_at_ms   = NowMs();

  auto other            = record;
  other.pair            = PersonPair{200, 201};
  other.avg_rating      = std::nullopt;
  other.years_active    = {1993};
  other.types           = collab::model::TypeSet{};
  other.types.Add(CollaborationType::kDirectorDirector);

  {
    auto tx = repo.Begin();
    assert(repo.LockPair(*tx, record.pair));
    assert(repo.UpsertCollaboration(*tx, record));
    assert(repo.UpsertCollaboration(*tx, other));
    assert(repo.InsertDetail(*tx, Detail(record.pair, 1, 1990)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto read = repo.GetCollaboration(*tx, record.pair);
  assert(read.has_value());
  assert(collab::graph::SameAggregates(*read, record));
  assert(read->updated_at_ms == record.updated_at_ms);
  assert(!repo.GetCollaboration(*tx, PersonPair{200, 202}).has_value());

  const auto of_201 = repo.ListCollaborationsForPerson(*tx, 201);
  assert(of_201.size() == 2);
  assert((of_201[0].pair == PersonPair{200, 201}));
  assert(!of_201[0].avg_rating.has_value());
  assert((of_201[1].pair == PersonPair{201, 202}));

  const auto neighbors = repo.ListNeighbors(*tx, {201, 202, 999});
  assert((neighbors.at(201) == std::vector<PersonId>{200, 202}));
  assert((neighbors.at(202) == std::vector<PersonId>{201}));
  assert(neighbors.find(999) == neighbors.end() || neighbors.at(999).empty());
  tx->Commit();

  // pair rows are only ever stored low < high
  auto bad = repo.Begin();
  CollaborationRecord reversed = record;
  reversed.pair                = PersonPair{202, 201};
  assert(!repo.UpsertCollaboration(*bad, reversed));
  bad->Rollback();

  auto clear = repo.Begin();
  assert(repo.DeleteAllCollaborations(*clear));
  clear->Commit();

  auto verify = repo.Begin();
  assert(!repo.GetCollaboration(*verify, record.pair).has_value());
  assert(repo.ListDetailsForPair(*verify, record.pair).empty());
  verify->Commit();
}

void VerifyDetailReadWrite(Repository& repo) {
  const PersonPair pair{301, 302};
  {
    auto tx = repo.Begin();
    assert(repo.InsertDetail(*tx, Detail(pair, 32, 2002)));
    assert(repo.InsertDetail(*tx, Detail(pair, 31, 2001)));
    assert(repo.InsertDetail(*tx, Detail(PersonPair{300, 301}, 30, 2000)));

    const auto duplicate = repo.InsertDetail(*tx, Detail(pair, 31, 2001));
    assert(duplicate.code == collab::db::ErrorCode::AlreadyExists);

    auto changed    = Detail(pair, 32, 2002);
    changed.rating  = std::nullopt;
    changed.revenue = 77;
    changed.genres  = {};
    assert(repo.UpdateDetail(*tx, changed));
    assert(!repo.UpdateDetail(*tx, Detail(pair, 99, 2009)));
    tx->Commit();
  }

  auto tx = repo.Begin();
  const auto detail = repo.GetDetail(*tx, pair, 32);
  assert(detail.has_value());
  assert(!detail->rating.has_value());
  assert(detail->revenue == 77);
  assert(detail->genres.empty());
  assert(detail->RoleOf(301) == RoleKind::kDirector);
  assert(!repo.GetDetail(*tx, pair, 99).has_value());

  const auto for_pair = repo.ListDetailsForPair(*tx, pair);
  assert(for_pair.size() == 2);
  assert(for_pair[0].work_id == 31);
  assert(for_pair[1].work_id == 32);
  assert(for_pair[0].SameContent(Detail(pair, 31, 2001)));

  const auto for_person = repo.ListDetailsForPerson(*tx, 301);
  assert(for_person.size() == 3);
  assert((for_person[0].pair == PersonPair{300, 301}));

  assert(repo.ListAllDetails(*tx).size() == 3);
  tx->Commit();

  auto clear = repo.Begin();
  assert(repo.DeleteAllCollaborations(*clear));
  clear->Commit();
}

void VerifyPathCacheReadWrite(Repository& repo) {
  PathCacheRecord fresh{PersonPair{401, 405}, {401, 402, 405}, 2, 5000};
  PathCacheRecord stale{PersonPair{401, 403}, {401, 403}, 1, 1000};
  {
    auto tx = repo.Begin();
    assert(repo.UpsertPathCache(*tx, fresh));
    assert(repo.UpsertPathCache(*tx, stale));
    tx->Commit();
  }

  {
    auto       tx   = repo.Begin();
    const auto read = repo.GetPathCache(*tx, fresh.pair);
    assert(read.has_value());
    assert(read->path == fresh.path);
    assert(read->path_length == 2);
    assert(read->computed_at_ms == 5000);
    assert(repo.DeleteExpiredPathCache(*tx, 2000));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetPathCache(*tx, fresh.pair).has_value());
  assert(!repo.GetPathCache(*tx, stale.pair).has_value());
  assert(repo.DeleteExpiredPathCache(*tx, NowMs()));
  tx->Commit();
}

void VerifyTrendSnapshot(Repository& repo) {
  const std::vector<TrendRecord> first{{PersonPair{501, 502}, 0.5, 1, 0, 2023, 1}, {PersonPair{501, 503}, 2.0, 2, 1, 2024, 1},
                                       {PersonPair{500, 504}, 0.5, 3, 0, 2024, 1}};
  {
    auto tx = repo.Begin();
    assert(repo.ReplaceTrendSnapshot(*tx, first));
    tx->Commit();
  }

  {
    auto       tx  = repo.Begin();
    const auto top = repo.ListTrending(*tx, 10);
    assert(top.size() == 3);
    assert((top[0].pair == PersonPair{501, 503}));
    // equal score: more recent collaborations first
    assert((top[1].pair == PersonPair{500, 504}));
    assert((top[2].pair == PersonPair{501, 502}));
    assert(repo.ListTrending(*tx, 1).size() == 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.ReplaceTrendSnapshot(*tx, {{PersonPair{600, 601}, 1.0, 1, 0, 2024, 2}}));
    tx->Commit();
  }

  auto       tx  = repo.Begin();
  const auto top = repo.ListTrending(*tx, 10);
  assert(top.size() == 1);
  assert((top[0].pair == PersonPair{600, 601}));
  assert(repo.ReplaceTrendSnapshot(*tx, {}));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertWork(*tx, Work(701, 2010)));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.UpsertWork(*tx, Work(702, 2010)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetWork(*tx, 701).has_value());
  assert(!repo.GetWork(*tx, 702).has_value());
  tx->Commit();
}

// Applies a small catalog with the worker pool and compares every pair row
// and a shortest path against the in-memory reference.
void VerifyGraphMatchesReference(const std::shared_ptr<Repository>& repo) {
  auto reference = std::make_shared<MemoryRepository>();
  for (auto* target : {static_cast<Repository*>(reference.get()), repo.get()}) {
    for (std::int64_t w = 801; w <= 808; ++w) {
      const auto base = static_cast<PersonId>(800 + w % 4);
      SeedWork(*target, Work(w, static_cast<std::int32_t>(1980 + w % 7), w % 3 == 0 ? std::nullopt : std::optional<double>(5.0 + w % 5),
                             w * 10, {"Drama", w % 2 == 0 ? "Comedy" : "Noir"}),
               {Director(w, base), Performer(w, base + 1, 1), Performer(w, base + 2, 2), Crew(w, base + 3, "Screenplay")});
    }
  }

  auto pool = std::make_shared<collab::population::ApplyWorkerPool>(4);
  pool->Start();
  collab::graph::AggregateStore reference_store(reference, collab::graph::EdgeBuilder(DefaultPolicy()));
  collab::graph::AggregateStore store(repo, collab::graph::EdgeBuilder(DefaultPolicy()), {}, pool);

  const auto expected = reference_store.RebuildAll();
  const auto actual   = store.RebuildAll();
  pool->Stop();
  assert(actual.works_failed == 0);
  assert(actual.pairs == expected.pairs);

  auto ref_tx = reference->Begin();
  auto tx     = repo->Begin();
  const auto ref_details = reference->ListAllDetails(*ref_tx);
  const auto details     = repo->ListAllDetails(*tx);
  assert(details.size() == ref_details.size());
  for (std::size_t i = 0; i < details.size(); ++i) {
    assert(details[i].SameContent(ref_details[i]));
    const auto want = reference->GetCollaboration(*ref_tx, ref_details[i].pair);
    const auto got  = repo->GetCollaboration(*tx, details[i].pair);
    assert(want.has_value() && got.has_value());
    assert(collab::graph::SameAggregates(*want, *got));
  }
  ref_tx->Commit();
  tx->Commit();

  collab::graph::PathFinder reference_finder(reference, nullptr);
  collab::graph::PathFinder finder(repo, nullptr);
  const auto                want = reference_finder.ShortestPath(801, 806, 6);
  const auto                got  = finder.ShortestPath(801, 806, 6);
  assert(want.Found() && got.Found());
  assert(want.path == got.path);
  assert(finder.ShortestPath(806, 801, 6).from_cache);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertWork(*tx, Work(901, 2015, 9.0)));
    assert(repo->ReplaceCredits(*tx, 901, {Performer(901, 9001, 1), Performer(901, 9002, 2)}));
    CollaborationRecord record;
    record.pair                = PersonPair{9001, 9002};
    record.collaboration_count = 1;
    record.first_year          = 2015;
    record.last_year           = 2015;
    record.years_active        = {2015};
    record.peak_year           = 2015;
    assert(repo->UpsertCollaboration(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetWork(*tx, 901).has_value());
  assert(repo->PersonExists(*tx, 9001));
  const auto pair = repo->GetCollaboration(*tx, PersonPair{9001, 9002});
  assert(pair.has_value());
  assert(pair->collaboration_count == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if COLLAB_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("collab_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    collab::runtime::config::DatabaseConfig database;
    database.mutable_sqlite()->set_path(db_path);
    return collab::factory::BuildRepository(database);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if COLLAB_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("COLLAB_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("COLLAB_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    collab::runtime::config::DatabaseConfig database;
    database.mutable_postgres()->set_connection_uri(conninfo);
    database.mutable_postgres()->set_max_connections(8);
    return collab::factory::BuildRepository(database);
  };
  auto truncate = [conninfo]() {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("TRUNCATE works, credits, collaborations, collaboration_details, path_cache, trend_snapshot;");
    tx.commit();
  };

  // schema first, then start from empty tables
  (void)make_repo();
  truncate();

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = truncate,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyCatalogReadWrite(*repo);
  VerifyGenreTagsKeptVerbatim(*repo);
  VerifyPairReadWrite(*repo);
  VerifyDetailReadWrite(*repo);
  VerifyPathCacheReadWrite(*repo);
  VerifyTrendSnapshot(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyGraphMatchesReference(repo);

  VerifyRestartDurability(backend);

  repo.reset();
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if COLLAB_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if COLLAB_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "collab_integration_repository_parity: pass\n";
  return 0;
}
