#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace settleup::db {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    case ErrorCode::PermissionDenied:
      throw util::PermissionDenied(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace settleup::db
