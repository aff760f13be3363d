#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "internal/util/errors.hpp"

namespace slideshow::storage::common {

/*
  Arrow status -> exception at the store boundary.

  The message names the store operation and path:
    "write videos/a.mp4: IOError: No space left on device"
  Invalid paths surface as InvalidArgument, everything else as
  std::runtime_error.
*/

inline std::string DescribeFailure(std::string_view op, std::string_view path, const arrow::Status& status) {
  std::string message(op);
  message.append(" ").append(path).append(": ").append(status.ToString());
  return message;
}

inline void ThrowIfError(const arrow::Status& status, std::string_view op, std::string_view path) {
  if (status.ok()) return;
  if (status.IsInvalid()) {
    throw util::InvalidArgument(DescribeFailure(op, path, status));
  }
  throw std::runtime_error(DescribeFailure(op, path, status));
}

template <typename T>
T ValueOrThrow(arrow::Result<T> result, std::string_view op, std::string_view path) {
  ThrowIfError(result.status(), op, path);
  return std::move(result).ValueUnsafe();
}

} // namespace slideshow::storage::common
