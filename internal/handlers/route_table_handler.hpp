#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

class RouteTableHandler : public HandlerBase {
 public:
  explicit RouteTableHandler(HandlerDeps deps);

 private:
  model::Value CreateRouteTable(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeRouteTables(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteRouteTable(const model::Value& params, const gateway::RequestContext& context);
  model::Value CreateRoute(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteRoute(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
