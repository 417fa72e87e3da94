#pragma once

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

// Static account and placement facts derived from the request context.
class RegionHandler : public HandlerBase {
 public:
  explicit RegionHandler(HandlerDeps deps);

 private:
  model::Value DescribeRegions(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeAvailabilityZones(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeAccountAttributes(const model::Value& params, const gateway::RequestContext& context);
};

// sts GetCallerIdentity: every caller is the account root.
class IdentityHandler : public HandlerBase {
 public:
  explicit IdentityHandler(HandlerDeps deps);

 private:
  model::Value GetCallerIdentity(const model::Value& params, const gateway::RequestContext& context);
};

} // namespace vera::handlers
