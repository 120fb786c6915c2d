#include "errors.hpp"

namespace dispatcher::util {

const char* ToString(DecodeErrorCode code) {
  switch (code) {
    case DecodeErrorCode::kMalformedIdentifier:
      return "malformed_identifier";
    case DecodeErrorCode::kUnknownState:
      return "unknown_state";
    case DecodeErrorCode::kFieldOverflow:
      return "field_overflow";
  }
  return "unknown";
}

const char* ToString(StoreErrorCode code) {
  switch (code) {
    case StoreErrorCode::kNotFound:
      return "not_found";
    case StoreErrorCode::kConflict:
      return "conflict";
    case StoreErrorCode::kIdGenerationExhausted:
      return "id_generation_exhausted";
    case StoreErrorCode::kStorageFailure:
      return "storage_failure";
  }
  return "unknown";
}

TransitionError::TransitionError(model::ProcessState from, model::ProcessState to)
    : std::runtime_error(std::string("illegal transition: ") + model::ToString(from) + " -> " + model::ToString(to)),
      from_(from),
      to_(to) {
}

} // namespace dispatcher::util
