#pragma once

#include <string>

namespace callscribe::db {

/*
  Portable DB result codes.

  Backends translate their own error codes into these; the event log and the
  source registry never see sqlite3 return codes.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

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

} // namespace callscribe::db
