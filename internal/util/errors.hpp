#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace settle::util {

/*
  Central error types.

  Every error raised by the engine derives from SettlementError and carries an
  ErrorClass. These get translated later to gRPC status codes.
*/

enum class ErrorClass : std::uint8_t {
  kCallerError,
  kRetryable,
  kFatalConsistency,
};

inline std::string_view ToString(ErrorClass error_class) {
  switch (error_class) {
    case ErrorClass::kCallerError:
      return "caller_error";
    case ErrorClass::kRetryable:
      return "retryable";
    case ErrorClass::kFatalConsistency:
      return "fatal_consistency";
  }
  return "unknown";
}

class SettlementError : public std::runtime_error {
 public:
  SettlementError(ErrorClass error_class, const std::string& msg) : std::runtime_error(msg), error_class_(error_class) {
  }

  ErrorClass Class() const noexcept {
    return error_class_;
  }

 private:
  ErrorClass error_class_;
};

// Malformed input: bad policy parameter, unknown participant, invalid event.
class ValidationError : public SettlementError {
 public:
  explicit ValidationError(const std::string& msg) : SettlementError(ErrorClass::kCallerError, msg) {
  }
};

class NotFound : public SettlementError {
 public:
  explicit NotFound(const std::string& msg) : SettlementError(ErrorClass::kCallerError, msg) {
  }
};

class AlreadyExists : public SettlementError {
 public:
  explicit AlreadyExists(const std::string& msg) : SettlementError(ErrorClass::kCallerError, msg) {
  }
};

// Transaction conflict or busy database. Safe to retry the whole run.
class Conflict : public SettlementError {
 public:
  explicit Conflict(const std::string& msg, bool busy = false) : SettlementError(ErrorClass::kRetryable, msg), busy_(busy) {
  }

  bool Busy() const noexcept {
    return busy_;
  }

 private:
  bool busy_;
};

// Internal invariant broken (e.g. conservation). Never retry.
class ConsistencyError : public SettlementError {
 public:
  explicit ConsistencyError(const std::string& msg) : SettlementError(ErrorClass::kFatalConsistency, msg) {
  }
};

} // namespace settle::util
