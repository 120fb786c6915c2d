#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace dispatcher::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace dispatcher::util;

  if (dynamic_cast<const DecodeError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const TransitionError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (const auto* store = dynamic_cast<const StoreError*>(&e)) {
    switch (store->code()) {
      case StoreErrorCode::kNotFound:
        return {::grpc::StatusCode::NOT_FOUND, e.what()};
      case StoreErrorCode::kConflict:
        return {::grpc::StatusCode::ABORTED, e.what()};
      case StoreErrorCode::kIdGenerationExhausted:
        return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
      case StoreErrorCode::kStorageFailure:
        return {::grpc::StatusCode::UNAVAILABLE, e.what()};
    }
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace dispatcher::grpc
