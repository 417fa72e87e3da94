#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

class InternetGatewayHandler : public HandlerBase {
 public:
  explicit InternetGatewayHandler(HandlerDeps deps);

 private:
  model::Value CreateInternetGateway(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeInternetGateways(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteInternetGateway(const model::Value& params, const gateway::RequestContext& context);
  model::Value AttachInternetGateway(const model::Value& params, const gateway::RequestContext& context);
  model::Value DetachInternetGateway(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
