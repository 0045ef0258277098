#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "collab/graph/v1/graph_service.grpc.pb.h"
#include "api/collab/graph/v1.hpp"

using namespace collab::graph::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  collabctl <addr> pair <person_a> <person_b>\n"
            << "  collabctl <addr> top <person_id> [limit] [type] [as_role]\n"
            << "  collabctl <addr> path <person_a> <person_b> [max_depth] [--works]\n"
            << "  collabctl <addr> trending [limit]\n"
            << "  collabctl <addr> similar <person_a> <person_b> [limit]\n"
            << "  collabctl <addr> diversity\n"
            << "  collabctl <addr> works <person_a> <person_b> [type]\n"
            << "  collabctl <addr> yearly <person_id>\n"
            << "  collabctl <addr> apply <work_id>\n"
            << "  collabctl <addr> rebuild\n"
            << "  collabctl <addr> refresh-trends\n"
            << "  collabctl <addr> stats\n"
            << "\n"
            << "  type    = performer-director|director-director|performer-performer|director-crew|crew-crew\n"
            << "  as_role = performer|director|crew\n";
}

static std::optional<CollaborationType> ParseType(const std::string& value) {
  if (value == "performer-director") return COLLABORATION_TYPE_PERFORMER_DIRECTOR;
  if (value == "director-director") return COLLABORATION_TYPE_DIRECTOR_DIRECTOR;
  if (value == "performer-performer") return COLLABORATION_TYPE_PERFORMER_PERFORMER;
  if (value == "director-crew") return COLLABORATION_TYPE_DIRECTOR_CREW;
  if (value == "crew-crew") return COLLABORATION_TYPE_CREW_CREW;
  return std::nullopt;
}

static std::optional<RoleClass> ParseRole(const std::string& value) {
  if (value == "performer") return ROLE_CLASS_PERFORMER;
  if (value == "director") return ROLE_CLASS_DIRECTOR;
  if (value == "crew") return ROLE_CLASS_CREW;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CollaborationGraphService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------
    if (cmd == "pair") {
      if (argc < 5) return 1;

      GetPairStatsRequest req;
      req.set_person_a(std::stoll(argv[3]));
      req.set_person_b(std::stoll(argv[4]));

      GetPairStatsResponse resp;
      auto                 status = stub->GetPairStats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& s = resp.stats();
      std::cout << "pair=" << s.pair().person_low_id() << ":" << s.pair().person_high_id() << " count=" << s.collaboration_count()
                << " years=" << s.first_year() << "-" << s.last_year() << " peak=" << s.peak_year();
      if (s.has_avg_rating()) std::cout << " avg_rating=" << s.avg_rating();
      std::cout << " revenue=" << s.total_revenue() << " types=";
      for (int i = 0; i < s.types_size(); ++i) {
        std::cout << (i ? "," : "") << CollaborationType_Name(s.types(i));
      }
      std::cout << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "top") {
      if (argc < 4) return 1;

      ListTopCollaboratorsRequest req;
      req.set_person_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_limit(std::stoi(argv[4]));
      if (argc >= 6) {
        auto type = ParseType(argv[5]);
        if (!type) {
          std::cerr << "unsupported type: " << argv[5] << "\n";
          return 1;
        }
        req.set_type(*type);
      }
      if (argc >= 7) {
        auto role = ParseRole(argv[6]);
        if (!role) {
          std::cerr << "unsupported role: " << argv[6] << "\n";
          return 1;
        }
        req.set_as_role(*role);
      }

      ListTopCollaboratorsResponse resp;
      auto                         status = stub->ListTopCollaborators(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& c : resp.collaborators()) {
        std::cout << c.person_id() << " count=" << c.collaboration_count() << " matching=" << c.matching_works();
        if (c.has_avg_rating()) std::cout << " avg_rating=" << c.avg_rating();
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "path") {
      if (argc < 5) return 1;

      FindShortestPathRequest req;
      req.set_person_a(std::stoll(argv[3]));
      req.set_person_b(std::stoll(argv[4]));
      for (int i = 5; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--works") {
          req.set_include_works(true);
        } else {
          req.set_max_depth(std::stoi(arg));
        }
      }

      FindShortestPathResponse resp;
      auto                     status = stub->FindShortestPath(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (!resp.found()) {
        std::cout << "no path within max_depth\n";
        return 0;
      }
      std::cout << "length=" << resp.length() << (resp.from_cache() ? " (cached)" : "") << " path=";
      for (int i = 0; i < resp.path_size(); ++i) {
        std::cout << (i ? " -> " : "") << resp.path(i);
      }
      std::cout << "\n";
      for (const auto& hop : resp.hops()) {
        std::cout << "  " << hop.from_person_id() << " -> " << hop.to_person_id() << " via work " << hop.work_id() << " ("
                  << hop.release_year() << ")\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "trending") {
      ListTrendingPairsRequest req;
      if (argc >= 4) req.set_limit(std::stoi(argv[3]));

      ListTrendingPairsResponse resp;
      auto                      status = stub->ListTrendingPairs(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& p : resp.pairs()) {
        std::cout << p.pair().person_low_id() << ":" << p.pair().person_high_id() << " score=" << p.trend_score()
                  << " recent=" << p.recent_count() << " baseline=" << p.baseline_count() << " last_year=" << p.last_year() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "similar") {
      if (argc < 5) return 1;

      ListSimilarCollaborationsRequest req;
      req.set_person_a(std::stoll(argv[3]));
      req.set_person_b(std::stoll(argv[4]));
      if (argc >= 6) req.set_limit(std::stoi(argv[5]));

      ListSimilarCollaborationsResponse resp;
      auto                              status = stub->ListSimilarCollaborations(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& s : resp.pairs()) {
        std::cout << s.pair().person_low_id() << ":" << s.pair().person_high_id() << " count=" << s.collaboration_count();
        if (s.has_avg_rating()) std::cout << " avg_rating=" << s.avg_rating();
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "diversity") {
      GetDiversityStatsResponse resp;
      auto                      status = stub->GetDiversityStats(&ctx, GetDiversityStatsRequest{}, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "pairs=" << resp.pairs() << " avg_genre=" << resp.avg_genre_diversity() << " avg_role=" << resp.avg_role_diversity()
                << " high_genre=" << resp.high_genre_diversity() << " high_role=" << resp.high_role_diversity() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "works") {
      if (argc < 5) return 1;

      ListPairWorksRequest req;
      req.set_person_a(std::stoll(argv[3]));
      req.set_person_b(std::stoll(argv[4]));
      if (argc >= 6) {
        auto type = ParseType(argv[5]);
        if (!type) {
          std::cerr << "unsupported type: " << argv[5] << "\n";
          return 1;
        }
        req.set_type(*type);
      }

      ListPairWorksResponse resp;
      auto                  status = stub->ListPairWorks(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& w : resp.works()) {
        std::cout << w.work_id() << " year=" << w.release_year() << " type=" << CollaborationType_Name(w.type()) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "yearly") {
      if (argc < 4) return 1;

      GetPersonYearlyTrendsRequest req;
      req.set_person_id(std::stoll(argv[3]));

      GetPersonYearlyTrendsResponse resp;
      auto                          status = stub->GetPersonYearlyTrends(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& y : resp.years()) {
        std::cout << y.year() << " collaborators=" << y.unique_collaborators() << " new=" << y.new_collaborators() << " works=" << y.works()
                  << " genres=" << y.distinct_genres() << " revenue=" << y.total_revenue() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "apply") {
      if (argc < 4) return 1;

      ApplyWorkRequest req;
      req.set_work_id(std::stoll(argv[3]));

      ApplyWorkResponse resp;
      auto              status = stub->ApplyWork(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& r = resp.report();
      std::cout << "work=" << r.work_id() << " candidates=" << r.candidates() << " inserted=" << r.details_inserted()
                << " updated=" << r.details_updated() << " unchanged=" << r.details_unchanged() << " skipped=" << r.skipped_credits()
                << " self_pairs=" << r.self_pairs_rejected() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "rebuild") {
      RebuildAllResponse resp;
      auto               status = stub->RebuildAll(&ctx, RebuildAllRequest{}, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "works_applied=" << resp.works_applied() << " works_failed=" << resp.works_failed() << " pairs=" << resp.pairs()
                << " duration_ms=" << resp.duration_ms() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "refresh-trends") {
      RefreshTrendsResponse resp;
      auto                  status = stub->RefreshTrends(&ctx, RefreshTrendsRequest{}, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "rows=" << resp.rows() << " reference_year=" << resp.reference_year() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    if (cmd == "stats") {
      GetStatsResponse resp;
      auto             status = stub->GetStats(&ctx, GetStatsRequest{}, &resp);
      if (!status.ok()) return Fail(status);

      const auto& s = resp.stats();
      std::cout << "works=" << s.works() << " credits=" << s.credits() << " collaborations=" << s.collaborations() << " details=" << s.details()
                << " cached_paths=" << s.cached_paths() << " trend_rows=" << s.trend_rows() << " path_computations=" << s.path_computations()
                << " path_cache_hits=" << s.path_cache_hits() << "\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoll and friends
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
