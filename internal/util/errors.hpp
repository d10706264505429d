#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace freightline::util {

/*
  Central error types.

  Every error carries a closed ErrorKind so batch callers can branch on
  the kind without catching each type separately.
*/

enum class ErrorKind : std::uint8_t {
  kMalformedTelemetry = 1,
  kTokenValidation,
  kRelationValidation,
  kInvalidStateTransition,
  kPersistence,
  kNotFound,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMalformedTelemetry:
      return "MALFORMED_TELEMETRY";
    case ErrorKind::kTokenValidation:
      return "TOKEN_VALIDATION";
    case ErrorKind::kRelationValidation:
      return "RELATION_VALIDATION";
    case ErrorKind::kInvalidStateTransition:
      return "INVALID_STATE_TRANSITION";
    case ErrorKind::kPersistence:
      return "PERSISTENCE";
    case ErrorKind::kNotFound:
      return "NOT_FOUND";
  }
  return "UNKNOWN";
}

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

  // True when the same input may succeed later without being changed.
  virtual bool Retryable() const noexcept {
    return false;
  }

 private:
  ErrorKind kind_;
};

// Sample is rejected as-is; never repaired.
class MalformedTelemetryError : public Error {
 public:
  explicit MalformedTelemetryError(const std::string& msg) : Error(ErrorKind::kMalformedTelemetry, msg) {
  }
};

// Missing or ill-typed metadata, or unknown token type.
class TokenValidationError : public Error {
 public:
  explicit TokenValidationError(const std::string& msg) : Error(ErrorKind::kTokenValidation, msg) {
  }
};

// Missing or dangling relation. The referenced token may show up later.
class RelationValidationError : public Error {
 public:
  explicit RelationValidationError(const std::string& msg) : Error(ErrorKind::kRelationValidation, msg) {
  }

  bool Retryable() const noexcept override {
    return true;
  }
};

class InvalidStateTransitionError : public Error {
 public:
  explicit InvalidStateTransitionError(const std::string& msg) : Error(ErrorKind::kInvalidStateTransition, msg) {
  }
};

class PersistenceError : public Error {
 public:
  PersistenceError(const std::string& msg, bool retryable) : Error(ErrorKind::kPersistence, msg), retryable_(retryable) {
  }

  bool Retryable() const noexcept override {
    return retryable_;
  }

 private:
  bool retryable_;
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorKind::kNotFound, msg) {
  }
};

} // namespace freightline::util
