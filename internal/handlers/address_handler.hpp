#pragma once

#include <string>

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

// Elastic IPs. Only the VPC domain is emulated.
class AddressHandler : public HandlerBase {
 public:
  explicit AddressHandler(HandlerDeps deps);

 private:
  model::Value AllocateAddress(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeAddresses(const model::Value& params, const gateway::RequestContext& context);
  model::Value ReleaseAddress(const model::Value& params, const gateway::RequestContext& context);
  model::Value AssociateAddress(const model::Value& params, const gateway::RequestContext& context);
  model::Value DisassociateAddress(const model::Value& params, const gateway::RequestContext& context);

  // AllocationId, or the allocation holding PublicIp.
  std::string ResolveAllocationId(const model::Value& params) const;
};

} // namespace vera::handlers
