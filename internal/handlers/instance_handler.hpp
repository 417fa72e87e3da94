#pragma once

#include <string>
#include <string_view>

#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

/*
  Instance lifecycle.

  Instances are created "pending" and moved to "running" before the launch
  call returns. Each instance gets an 8 GiB root volume attached at
  /dev/xvda that is deleted on termination. Terminated instances stay
  describable.
*/
class InstanceHandler : public HandlerBase {
 public:
  explicit InstanceHandler(HandlerDeps deps);

 private:
  model::Value RunInstances(const model::Value& params, const gateway::RequestContext& context);
  model::Value DescribeInstances(const model::Value& params, const gateway::RequestContext& context);
  model::Value TerminateInstances(const model::Value& params, const gateway::RequestContext& context);
  model::Value StopInstances(const model::Value& params, const gateway::RequestContext& context);
  model::Value StartInstances(const model::Value& params, const gateway::RequestContext& context);

  // Lowest private address of the subnet not held by a live instance;
  // consumes one address from the subnet's count.
  std::string AllocatePrivateIp(store::StoreTransaction& transaction, const std::string& subnet_id);
  // Hands a terminating instance's address back to its subnet.
  void ReleasePrivateIp(store::StoreTransaction& transaction, const model::Resource& instance);
  void CreateRootVolume(store::StoreTransaction& transaction, const model::Resource& instance, const std::string& zone);
  // Detaches volumes (deleting the delete-on-termination ones) and
  // disassociates elastic IPs.
  void ReleaseAttachments(store::StoreTransaction& transaction, const std::string& instance_id);
  model::Value RenderInstance(const model::Resource& instance) const;
};

// Provider state code for an instance state name.
int InstanceStateCode(std::string_view state);

} // namespace vera::handlers
