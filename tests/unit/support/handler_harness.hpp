#pragma once

#include <exception>
#include <initializer_list>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/gateway/api_error.hpp"
#include "internal/gateway/resource_handler.hpp"
#include "internal/model/value.hpp"

namespace vera::testing {

/*
  Drives handlers through the router of a fully built application, without
  the wire codecs. Errors come back as their provider error code.
*/
class HandlerHarness {
 public:
  HandlerHarness() : app_(factory::Build(config::ConfigLoader::Defaults())) {
    context_ = {"req-test", "ec2", "us-east-1", "000000000000"};
  }

  model::Value Call(const std::string& action, const model::Value& params = model::Value::Map()) {
    return app_.router->Resolve(context_.service, action).Handle(action, params, context_);
  }

  // Empty when the call succeeded.
  std::string ErrorCode(const std::string& action, const model::Value& params = model::Value::Map()) {
    try {
      Call(action, params);
    } catch (const std::exception& e) {
      return gateway::ToApiError(e, *app_.registry).code;
    }
    return {};
  }

  store::ResourceStore& store() {
    return *app_.store;
  }

  gateway::RequestContext& context() {
    return context_;
  }

 private:
  factory::Application    app_;
  gateway::RequestContext context_;
};

// {"a", "b"} as a decoded positional list.
inline model::Value List(std::initializer_list<model::Value> items) {
  auto list = model::Value::List();
  for (const auto& item : items) {
    list.Append(item);
  }
  return list;
}

} // namespace vera::testing
