#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/model/resource_type.hpp"

namespace vera::util {

/*
  Central error types.

  Raised where the condition is detected and translated once at the
  boundary: to the provider's error envelope by the gateway, to gRPC status
  codes by the admin plane.
*/

// Request could not be decoded or a parameter has the wrong shape.
class MalformedParameter : public std::runtime_error {
 public:
  explicit MalformedParameter(const std::string& msg, std::string code = "InvalidParameterValue")
      : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

// A resource-specific precondition failed.
class ValidationFailed : public std::runtime_error {
 public:
  ValidationFailed(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

class NotFound : public std::runtime_error {
 public:
  NotFound(std::optional<model::ResourceType> type, std::string id, const std::string& msg)
      : std::runtime_error(msg), type_(type), id_(std::move(id)) {
  }

  const std::optional<model::ResourceType>& type() const {
    return type_;
  }
  const std::string& id() const {
    return id_;
  }

 private:
  std::optional<model::ResourceType> type_;
  std::string                        id_;
};

class DependencyViolation : public std::runtime_error {
 public:
  explicit DependencyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedAction : public std::runtime_error {
 public:
  UnsupportedAction(const std::string& service, const std::string& action)
      : std::runtime_error("The action " + action + " is not valid for this web service (" + service + ")."), action_(action) {
  }

  const std::string& action() const {
    return action_;
  }

 private:
  std::string action_;
};

// ID exhaustion or a broken invariant. The only category logged loudly.
class InternalError : public std::runtime_error {
 public:
  explicit InternalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace vera::util
