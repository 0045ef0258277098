#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

namespace pb = collab::graph::v1;

using namespace collab::testing;

collab::grpc::GraphServer BuildServer() {
  auto repo  = std::make_shared<collab::db::memory::MemoryRepository>();
  auto graph = MakeGraph(repo);

  SeedWork(*repo, Work(1, 2001), {Director(1, 1), Performer(1, 2, 1)});
  graph->ApplyIncremental(1);

  return collab::grpc::GraphServer(std::make_shared<collab::service::GraphService>(collab::service::ServiceContext{graph}));
}

void TestPairStatsOk() {
  auto server = BuildServer();

  pb::GetPairStatsRequest req;
  req.set_person_a(1);
  req.set_person_b(2);
  pb::GetPairStatsResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.GetPairStats(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.stats().collaboration_count() == 1);
}

void TestUnknownPersonReturnsNotFound() {
  auto server = BuildServer();

  pb::ListTopCollaboratorsRequest req;
  req.set_person_id(99);
  pb::ListTopCollaboratorsResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = server.ListTopCollaborators(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSelfPairReturnsInvalidArgument() {
  auto server = BuildServer();

  pb::ListPairWorksRequest req;
  req.set_person_a(2);
  req.set_person_b(2);
  pb::ListPairWorksResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server.ListPairWorks(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestExceptionMapping() {
  assert(collab::grpc::ToStatus(collab::util::AlreadyRunning("rebuild already running")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(collab::grpc::ToStatus(collab::util::Unavailable("store unavailable")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(collab::grpc::ToStatus(std::invalid_argument("bad pair")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(collab::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestPairStatsOk();
  TestUnknownPersonReturnsNotFound();
  TestSelfPairReturnsInvalidArgument();
  TestExceptionMapping();

  std::cout << "collab_unit_grpc_status: pass\n";
  return 0;
}
