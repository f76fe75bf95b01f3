#pragma once

#include <string>
#include <utility>

namespace settleup::db {

/*
  Portable store result codes.

  Store implementations must translate backend errors into these.
  Upper layers should never depend on transport or driver error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  PermissionDenied,

  ConstraintViolation,

  Unavailable,
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

// Maps a failed result onto the util error types; no-op on success.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace settleup::db
