#pragma once

#include <string>

#include "internal/gateway/api_error.hpp"
#include "internal/gateway/service_catalog.hpp"
#include "internal/model/value.hpp"

namespace vera::gateway {

struct EncodedBody {
  std::string content_type;
  std::string body;
};

// Wraps a handler result in the service's success envelope.
EncodedBody EncodeSuccess(const ServiceDefinition& service, const std::string& action, const std::string& request_id, const model::Value& body);

// Error document in the service's protocol.
EncodedBody EncodeError(const ServiceDefinition& service, const ApiError& error, const std::string& request_id);

} // namespace vera::gateway
