#pragma once

#include <string>

namespace claimstone::db {

/*
  Outcome of a region store call.

  Adapters translate backend failures into these codes; nothing above the
  store sees sqlite error types. A missing world or region is NotFound, a
  second CreateWorld for the same name is AlreadyExists.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,
  ConstraintViolation,

  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
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

  // "<code>: <message>", for exception and log text
  std::string Describe() const {
    return message.empty() ? ErrorCodeName(code) : std::string(ErrorCodeName(code)) + ": " + message;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace claimstone::db
