#pragma once

#include <stdexcept>
#include <string>

#include "internal/model/process_state.hpp"

namespace dispatcher::util {

/*
  Central error types.

  Every failure a caller can see is one of these. They get translated
  later to gRPC status codes.
*/

enum class DecodeErrorCode {
  kMalformedIdentifier,
  kUnknownState,
  kFieldOverflow,
};

enum class StoreErrorCode {
  kNotFound,
  kConflict,
  kIdGenerationExhausted,
  kStorageFailure,
};

const char* ToString(DecodeErrorCode code);
const char* ToString(StoreErrorCode code);

class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  DecodeErrorCode code() const {
    return code_;
  }

 private:
  DecodeErrorCode code_;
};

// Requested state change is not an edge of the state machine.
class TransitionError : public std::runtime_error {
 public:
  TransitionError(model::ProcessState from, model::ProcessState to);

  model::ProcessState from() const {
    return from_;
  }
  model::ProcessState to() const {
    return to_;
  }

 private:
  model::ProcessState from_;
  model::ProcessState to_;
};

class StoreError : public std::runtime_error {
 public:
  StoreError(StoreErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  StoreErrorCode code() const {
    return code_;
  }

 private:
  StoreErrorCode code_;
};

} // namespace dispatcher::util
