#pragma once

#include <string>

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

/*
  Security groups and their rules.

  Rules are identified by (protocol, from-port, to-port, CIDR). Stored
  permissions group the CIDRs of one (protocol, port range) the way the
  provider reports them.
*/
class SecurityGroupHandler : public HandlerBase {
 public:
  explicit SecurityGroupHandler(HandlerDeps deps);

 private:
  enum class Direction { kIngress, kEgress };

  model::Value CreateSecurityGroup(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeSecurityGroups(const model::Value& params, const gateway::RequestContext& context);
  model::Value DeleteSecurityGroup(const model::Value& params, const gateway::RequestContext& context);
  model::Value Authorize(const model::Value& params, Direction direction);
  model::Value Revoke(const model::Value& params, Direction direction);

  // GroupId, or GroupName resolved in the default VPC.
  std::string ResolveGroupId(const model::Value& params) const;
};

} // namespace vera::handlers
