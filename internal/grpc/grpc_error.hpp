#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace dispatcher::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    DecodeError            INVALID_ARGUMENT
    TransitionError        FAILED_PRECONDITION
    StoreError::NotFound   NOT_FOUND
    StoreError::Conflict   ABORTED
    IdGenerationExhausted  RESOURCE_EXHAUSTED
    StorageFailure         UNAVAILABLE
    anything else          INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace dispatcher::grpc
