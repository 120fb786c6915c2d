#pragma once

#include <stdexcept>
#include <string>

namespace dispatcher::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

// Codes after which repeating the whole transaction may succeed.
inline bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by read paths (which return rows, not a Result) when the
  backend fails. Carries the same portable code.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  explicit DbError(const Result& result) : DbError(result.code, result.message) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

} // namespace dispatcher::db
