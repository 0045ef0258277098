#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace collab::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    util::InvalidArgument  -> INVALID_ARGUMENT
    util::NotFound         -> NOT_FOUND
    util::AlreadyRunning   -> ABORTED
    util::Unavailable      -> UNAVAILABLE
    anything else          -> INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace collab::grpc
