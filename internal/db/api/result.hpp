#pragma once

#include <string>

namespace storykb::db {

/*
  Portable DB result codes.

  Repositories translate backend errors into these; the registry and the
  ledger never see sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

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

} // namespace storykb::db
