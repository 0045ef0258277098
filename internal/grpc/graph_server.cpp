#include "graph_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace collab::grpc {

namespace pb = collab::graph::v1;

GraphServer::GraphServer(std::shared_ptr<collab::service::GraphService> svc) : service_(std::move(svc)) {
}

::grpc::Status GraphServer::GetPairStats(::grpc::ServerContext*, const pb::GetPairStatsRequest* req, pb::GetPairStatsResponse* resp) {
  try {
    *resp = service_->GetPairStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ListTopCollaborators(::grpc::ServerContext*, const pb::ListTopCollaboratorsRequest* req, pb::ListTopCollaboratorsResponse* resp) {
  try {
    *resp = service_->ListTopCollaborators(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::FindShortestPath(::grpc::ServerContext*, const pb::FindShortestPathRequest* req, pb::FindShortestPathResponse* resp) {
  try {
    *resp = service_->FindShortestPath(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ListTrendingPairs(::grpc::ServerContext*, const pb::ListTrendingPairsRequest* req, pb::ListTrendingPairsResponse* resp) {
  try {
    *resp = service_->ListTrendingPairs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ListSimilarCollaborations(::grpc::ServerContext*, const pb::ListSimilarCollaborationsRequest* req,
                                                      pb::ListSimilarCollaborationsResponse* resp) {
  try {
    *resp = service_->ListSimilarCollaborations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::GetDiversityStats(::grpc::ServerContext*, const pb::GetDiversityStatsRequest* req, pb::GetDiversityStatsResponse* resp) {
  try {
    *resp = service_->GetDiversityStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ListPairWorks(::grpc::ServerContext*, const pb::ListPairWorksRequest* req, pb::ListPairWorksResponse* resp) {
  try {
    *resp = service_->ListPairWorks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::GetPersonYearlyTrends(::grpc::ServerContext*, const pb::GetPersonYearlyTrendsRequest* req, pb::GetPersonYearlyTrendsResponse* resp) {
  try {
    *resp = service_->GetPersonYearlyTrends(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::GetStats(::grpc::ServerContext*, const pb::GetStatsRequest* req, pb::GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::ApplyWork(::grpc::ServerContext*, const pb::ApplyWorkRequest* req, pb::ApplyWorkResponse* resp) {
  try {
    *resp = service_->ApplyWork(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::RebuildAll(::grpc::ServerContext*, const pb::RebuildAllRequest* req, pb::RebuildAllResponse* resp) {
  try {
    *resp = service_->RebuildAll(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::RefreshTrends(::grpc::ServerContext*, const pb::RefreshTrendsRequest* req, pb::RefreshTrendsResponse* resp) {
  try {
    *resp = service_->RefreshTrends(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace collab::grpc
