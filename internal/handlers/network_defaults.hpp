#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/gateway/resource_handler.hpp"
#include "internal/model/resource.hpp"
#include "internal/store/resource_store.hpp"
#include "internal/util/cidr.hpp"

namespace vera::handlers {

/*
  Building blocks shared by the VPC and subnet handlers.

  Every VPC comes with a default security group, a main route table holding
  the "local" route and a default network ACL. The resource type registry
  declares these as the VPC's cascade set.
*/

model::Value NewVpcAttributes(const util::Ipv4Cidr& cidr, const std::string& tenancy, bool is_default, const gateway::RequestContext& context);

model::Value NewSubnetAttributes(const std::string& vpc_id, const util::Ipv4Cidr& cidr, const std::string& zone,
                                 const gateway::RequestContext& context);

// Creates the VPC and its default companions inside `transaction`, so the
// VPC is never observable without them.
model::Resource CreateVpcWithDefaults(store::StoreTransaction& transaction, model::Value attributes, std::vector<model::Tag> tags,
                                      const gateway::RequestContext& context);

// Subnet creation with range and conflict checks against the VPC.
model::Resource CreateSubnetChecked(store::StoreTransaction& transaction, const std::string& vpc_id, const util::Ipv4Cidr& cidr, const std::string& zone,
                                    std::vector<model::Tag> tags, const gateway::RequestContext& context, bool default_for_az = false);

const model::Resource* FindDefaultSecurityGroup(const store::StoreView& view, const std::string& vpc_id);
const model::Resource* FindMainRouteTable(const store::StoreView& view, const std::string& vpc_id);

} // namespace vera::handlers
