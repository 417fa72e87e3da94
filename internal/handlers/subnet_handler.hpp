#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

class SubnetHandler : public HandlerBase {
 public:
  explicit SubnetHandler(HandlerDeps deps);

 private:
  model::Value CreateSubnet(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeSubnets(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteSubnet(const model::Value& params, const gateway::RequestContext& context);
};

// Read-only: network ACLs only exist as VPC defaults.
class NetworkAclHandler : public HandlerBase {
 public:
  explicit NetworkAclHandler(HandlerDeps deps);

 private:
  model::Value DescribeNetworkAcls(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
