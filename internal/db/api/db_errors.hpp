#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::db {

// Raises the service error matching a failed Result; no-op on success.
// The message reads "<context>: <code name>: <backend message>".
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + std::string(ErrorCodeName(result.code));
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::InvalidState(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace slideshow::db
