#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace slideshow::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace slideshow::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const EmptyInput*>(&e) ||
      dynamic_cast<const MissingAsset*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace slideshow::grpc
