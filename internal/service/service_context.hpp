#pragma once

#include <memory>

namespace collab::core {
class CollaborationGraph;
}

namespace collab::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<collab::core::CollaborationGraph> graph;
};

} // namespace collab::service
