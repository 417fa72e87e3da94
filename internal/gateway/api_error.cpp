#include "internal/gateway/api_error.hpp"

#include "internal/util/errors.hpp"

namespace vera::gateway {

ApiError ToApiError(const std::exception& e, const model::ResourceTypeRegistry& registry) {
  using namespace vera::util;

  if (const auto* malformed = dynamic_cast<const MalformedParameter*>(&e)) {
    return {400, malformed->code(), e.what()};
  }
  if (const auto* failed = dynamic_cast<const ValidationFailed*>(&e)) {
    return {400, failed->code(), e.what()};
  }
  if (const auto* not_found = dynamic_cast<const NotFound*>(&e)) {
    std::string code = "InvalidID";
    if (not_found->type()) {
      code = registry.Get(*not_found->type()).not_found_code;
    }
    return {400, code, e.what()};
  }
  if (dynamic_cast<const DependencyViolation*>(&e)) {
    return {400, "DependencyViolation", e.what()};
  }
  if (dynamic_cast<const UnsupportedAction*>(&e)) {
    return {400, "InvalidAction", e.what()};
  }
  if (dynamic_cast<const InternalError*>(&e)) {
    return {500, "InternalError", e.what(), false};
  }

  return {500, "InternalError", "An internal error has occurred", false};
}

} // namespace vera::gateway
