#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace vera::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace vera::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const MalformedParameter*>(&e) || dynamic_cast<const ValidationFailed*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const DependencyViolation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UnsupportedAction*>(&e)) {
    return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace vera::grpc
