#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

class VpcHandler : public HandlerBase {
 public:
  explicit VpcHandler(HandlerDeps deps);

 private:
  model::Value CreateVpc(const model::Value& params, const gateway::RequestContext& context);
  model::Value CreateDefaultVpc(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeVpcs(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteVpc(const model::Value& params, const gateway::RequestContext& context);
  model::Value ModifyVpcAttribute(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeVpcAttribute(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
