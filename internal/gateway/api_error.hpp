#pragma once

#include <exception>
#include <string>

#include "internal/model/resource_type.hpp"

namespace vera::gateway {

// Error as it goes on the wire.
struct ApiError {
  unsigned    http_status = 400;
  std::string code;
  std::string message;
  // false for server-side faults (query protocol <Type>Receiver</Type>).
  bool sender = true;
};

/*
  Maps the exceptions of util/errors.hpp to provider error codes. NotFound
  takes the code declared for its resource type; anything unrecognised is an
  InternalError with HTTP 500.
*/
ApiError ToApiError(const std::exception& e, const model::ResourceTypeRegistry& registry);

} // namespace vera::gateway
