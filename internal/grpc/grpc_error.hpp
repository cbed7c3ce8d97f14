#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace settle::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    ValidationError   INVALID_ARGUMENT
    NotFound          NOT_FOUND
    AlreadyExists     ALREADY_EXISTS
    Conflict          ABORTED, UNAVAILABLE when the database was busy
    ConsistencyError  DATA_LOSS
    anything else     INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace settle::grpc
