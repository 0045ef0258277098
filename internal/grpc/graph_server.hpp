#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "collab/graph/v1/graph_service.grpc.pb.h"
#include "internal/service/graph_service.hpp"

namespace collab::grpc {

// Thin transport adapter: every RPC forwards to GraphService and maps
// exceptions with ToStatus.
class GraphServer final : public collab::graph::v1::CollaborationGraphService::Service {
 public:
  explicit GraphServer(std::shared_ptr<collab::service::GraphService> svc);

  ::grpc::Status GetPairStats(::grpc::ServerContext*, const collab::graph::v1::GetPairStatsRequest*,
                              collab::graph::v1::GetPairStatsResponse*) override;

  ::grpc::Status ListTopCollaborators(::grpc::ServerContext*, const collab::graph::v1::ListTopCollaboratorsRequest*,
                                      collab::graph::v1::ListTopCollaboratorsResponse*) override;

  ::grpc::Status FindShortestPath(::grpc::ServerContext*, const collab::graph::v1::FindShortestPathRequest*,
                                  collab::graph::v1::FindShortestPathResponse*) override;

  ::grpc::Status ListTrendingPairs(::grpc::ServerContext*, const collab::graph::v1::ListTrendingPairsRequest*,
                                   collab::graph::v1::ListTrendingPairsResponse*) override;

  ::grpc::Status ListSimilarCollaborations(::grpc::ServerContext*, const collab::graph::v1::ListSimilarCollaborationsRequest*,
                                           collab::graph::v1::ListSimilarCollaborationsResponse*) override;

  ::grpc::Status GetDiversityStats(::grpc::ServerContext*, const collab::graph::v1::GetDiversityStatsRequest*,
                                   collab::graph::v1::GetDiversityStatsResponse*) override;

  ::grpc::Status ListPairWorks(::grpc::ServerContext*, const collab::graph::v1::ListPairWorksRequest*,
                               collab::graph::v1::ListPairWorksResponse*) override;

  ::grpc::Status GetPersonYearlyTrends(::grpc::ServerContext*, const collab::graph::v1::GetPersonYearlyTrendsRequest*,
                                       collab::graph::v1::GetPersonYearlyTrendsResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*, const collab::graph::v1::GetStatsRequest*, collab::graph::v1::GetStatsResponse*) override;

  ::grpc::Status ApplyWork(::grpc::ServerContext*, const collab::graph::v1::ApplyWorkRequest*, collab::graph::v1::ApplyWorkResponse*) override;

  ::grpc::Status RebuildAll(::grpc::ServerContext*, const collab::graph::v1::RebuildAllRequest*, collab::graph::v1::RebuildAllResponse*) override;

  ::grpc::Status RefreshTrends(::grpc::ServerContext*, const collab::graph::v1::RefreshTrendsRequest*,
                               collab::graph::v1::RefreshTrendsResponse*) override;

 private:
  std::shared_ptr<collab::service::GraphService> service_;
};

} // namespace collab::grpc
