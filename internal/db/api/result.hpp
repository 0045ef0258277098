#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace collab::db {

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

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
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
  Thrown where a Result cannot be returned: Begin(), Commit() and reads that
  hand back values. Carries the same portable code.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {
  }

  explicit DbError(const Result& result) : DbError(result.code, result.message) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Another attempt of the same transaction is expected to succeed.
inline bool IsConflict(ErrorCode code) {
  return code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure;
}

// The store is temporarily unable to serve; retry a bounded number of times.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError;
}

} // namespace collab::db
