#pragma once

#include "api/collab/graph/v1.hpp"
#include "service_context.hpp"

namespace collab::service {

/*
  Protobuf adapter around the collaboration graph.

  Translates requests into core calls and results into responses. Not-found
  results become util::NotFound here so the transport can map them.
*/
class GraphService {
 public:
  explicit GraphService(ServiceContext ctx);

  collab::graph::v1::GetPairStatsResponse GetPairStats(const collab::graph::v1::GetPairStatsRequest& req);

  collab::graph::v1::ListTopCollaboratorsResponse ListTopCollaborators(const collab::graph::v1::ListTopCollaboratorsRequest& req);

  collab::graph::v1::FindShortestPathResponse FindShortestPath(const collab::graph::v1::FindShortestPathRequest& req);

  collab::graph::v1::ListTrendingPairsResponse ListTrendingPairs(const collab::graph::v1::ListTrendingPairsRequest& req);

  collab::graph::v1::ListSimilarCollaborationsResponse ListSimilarCollaborations(
      const collab::graph::v1::ListSimilarCollaborationsRequest& req);

  collab::graph::v1::GetDiversityStatsResponse GetDiversityStats(const collab::graph::v1::GetDiversityStatsRequest& req);

  collab::graph::v1::ListPairWorksResponse ListPairWorks(const collab::graph::v1::ListPairWorksRequest& req);

  collab::graph::v1::GetPersonYearlyTrendsResponse GetPersonYearlyTrends(const collab::graph::v1::GetPersonYearlyTrendsRequest& req);

  collab::graph::v1::GetStatsResponse GetStats(const collab::graph::v1::GetStatsRequest& req);

  collab::graph::v1::ApplyWorkResponse ApplyWork(const collab::graph::v1::ApplyWorkRequest& req);

  collab::graph::v1::RebuildAllResponse RebuildAll(const collab::graph::v1::RebuildAllRequest& req);

  collab::graph::v1::RefreshTrendsResponse RefreshTrends(const collab::graph::v1::RefreshTrendsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace collab::service
