#include "internal/handlers/subnet_handler.hpp"

#include "internal/handlers/handler_util.hpp"
#include "internal/handlers/network_defaults.hpp"
#include "internal/util/cidr.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

SubnetHandler::SubnetHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateSubnet", [this](const Value& p, const gateway::RequestContext& c) { return CreateSubnet(p, c); });
  On("DescribeSubnets", [this](const Value& p, const gateway::RequestContext& c) { return DescribeSubnets(p, c); });
  On("DeleteSubnet", [this](const Value& p, const gateway::RequestContext& c) { return DeleteSubnet(p, c); });
}

Value SubnetHandler::CreateSubnet(const Value& params, const gateway::RequestContext& context) {
  const auto vpc_id = RequireString(params, "VpcId");
  const auto text   = RequireString(params, "CidrBlock");

  const auto cidr = util::ParseIpv4Cidr(text);
  if (!cidr) {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + text + ") for parameter cidrBlock is invalid. This is not a valid CIDR block.");
  }
  if (cidr->prefix < 16 || cidr->prefix > 28) {
    throw util::ValidationFailed("InvalidSubnet.Range", "The CIDR '" + text + "' is invalid.");
  }

  const auto zone = OptionalString(params, "AvailabilityZone", context.region + "a");
  if (!IsAvailabilityZone(context.region, zone)) {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + zone + ") for parameter availabilityZone is invalid. Subnets can currently only be created in the following availability zones: " +
                                                              context.region + "a, " + context.region + "b, " + context.region + "c.");
  }

  auto            tags = TagsFor(params, "subnet");
  model::Resource subnet;
  store().Transact([&](store::StoreTransaction& transaction) {
    subnet = CreateSubnetChecked(transaction, vpc_id, *cidr, zone, std::move(tags), context);
  });
  return Value::Map({{"Subnet", Render(subnet)}});
}

Value SubnetHandler::DescribeSubnets(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& subnet : DescribeResources(store(), filters(), ResourceType::kSubnet, StringList(params, "SubnetId"), params)) {
    list.Append(Render(subnet));
  }
  return Value::Map({{"Subnets", std::move(list)}});
}

Value SubnetHandler::DeleteSubnet(const Value& params, const gateway::RequestContext&) {
  store().Delete(ResourceType::kSubnet, RequireString(params, "SubnetId"));
  return ReturnTrue();
}

// ------------------------------------------------------------
// Network ACLs
// ------------------------------------------------------------

NetworkAclHandler::NetworkAclHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("DescribeNetworkAcls", [this](const Value& p, const gateway::RequestContext& c) { return DescribeNetworkAcls(p, c); });
}

Value NetworkAclHandler::DescribeNetworkAcls(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& acl : DescribeResources(store(), filters(), ResourceType::kNetworkAcl, StringList(params, "NetworkAclId"), params)) {
    list.Append(Render(acl));
  }
  return Value::Map({{"NetworkAcls", std::move(list)}});
}

} // namespace vera::handlers
