#pragma once

#include <stdexcept>
#include <string>

namespace freightline::db {

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

constexpr const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Conflict:
      return "Conflict";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::SerializationFailure:
      return "SerializationFailure";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
}

// Transient failures: the same write may succeed on retry.
constexpr bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure ||
         code == ErrorCode::IOError;
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
  Thrown by Begin()/Commit()/Rollback() and by reads that cannot return a
  Result. Carries the portable code so callers can decide on retry.
*/
class TransactionError : public std::runtime_error {
 public:
  TransactionError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

} // namespace freightline::db
