#pragma once

#include <string>
#include <vector>

#include "internal/model/value.hpp"

namespace vera::gateway {

// Per-request facts a handler may need besides its parameters.
struct RequestContext {
  std::string request_id;
  std::string service;
  std::string region;
  std::string account_id;
};

/*
  One resource type's slice of a service API.

  Handle() returns the result body as a tree keyed by the provider's
  canonical member names, or raises one of the util/errors.hpp exceptions.
  The gateway owns decoding, envelopes and wire casing.
*/
class ResourceHandler {
 public:
  virtual ~ResourceHandler() = default;

  // Action names this handler serves.
  virtual std::vector<std::string> Actions() const = 0;

  virtual model::Value Handle(const std::string& action, const model::Value& params, const RequestContext& context) = 0;
};

} // namespace vera::gateway
