#include "internal/handlers/network_defaults.hpp"

#include <algorithm>
#include <functional>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

Value DefaultAclEntries() {
  auto entries = Value::List();
  for (bool egress : {false, true}) {
    entries.Append(Value::Map({{"CidrBlock", "0.0.0.0/0"},
                               {"Egress", egress},
                               {"Protocol", "-1"},
                               {"RuleAction", "allow"},
                               {"RuleNumber", 100}}));
    entries.Append(Value::Map({{"CidrBlock", "0.0.0.0/0"},
                               {"Egress", egress},
                               {"Protocol", "-1"},
                               {"RuleAction", "deny"},
                               {"RuleNumber", 32767}}));
  }
  return entries;
}

const model::Resource* FindInVpc(const store::StoreView& view, ResourceType type, const std::string& vpc_id,
                                 const std::function<bool(const model::Resource&)>& match) {
  for (const auto* resource : view.List(type)) {
    if (resource->attributes.GetString("VpcId") == vpc_id && match(*resource)) return resource;
  }
  return nullptr;
}

} // namespace

Value NewVpcAttributes(const util::Ipv4Cidr& cidr, const std::string& tenancy, bool is_default, const gateway::RequestContext& context) {
  auto associations = Value::List();
  associations.Append(Value::Map({
      {"AssociationId", util::MakeId("vpc-cidr-assoc", 17)},
      {"CidrBlock", cidr.ToString()},
      {"CidrBlockState", Value::Map({{"State", "associated"}})},
  }));

  return Value::Map({
      {"CidrBlock", cidr.ToString()},
      {"DhcpOptionsId", "default"},
      {"InstanceTenancy", tenancy},
      {"IsDefault", is_default},
      {"OwnerId", context.account_id},
      {"CidrBlockAssociationSet", std::move(associations)},
      {"EnableDnsSupport", true},
      {"EnableDnsHostnames", is_default},
  });
}

Value NewSubnetAttributes(const std::string& vpc_id, const util::Ipv4Cidr& cidr, const std::string& zone, const gateway::RequestContext& context) {
  // The provider reserves the first four and the last address of each subnet.
  const auto usable = static_cast<std::int64_t>(cidr.Size()) - 5;

  return Value::Map({
      {"VpcId", vpc_id},
      {"CidrBlock", cidr.ToString()},
      {"AvailabilityZone", zone},
      {"AvailabilityZoneId", AvailabilityZoneId(zone)},
      {"AvailableIpAddressCount", usable},
      {"DefaultForAz", false},
      {"MapPublicIpOnLaunch", false},
      {"AssignIpv6AddressOnCreation", false},
      {"Ipv6CidrBlockAssociationSet", Value::List()},
      {"OwnerId", context.account_id},
  });
}

model::Resource CreateVpcWithDefaults(store::StoreTransaction& transaction, Value attributes, std::vector<model::Tag> tags,
                                      const gateway::RequestContext& context) {
  const auto cidr = attributes.GetString("CidrBlock");
  auto       vpc  = transaction.Create(ResourceType::kVpc, std::move(attributes), std::move(tags));

  auto anywhere = Value::List();
  anywhere.Append(Value::Map({{"CidrIp", "0.0.0.0/0"}}));
  auto egress = Value::List();
  egress.Append(Value::Map({
      {"IpProtocol", "-1"},
      {"IpRanges", std::move(anywhere)},
      {"UserIdGroupPairs", Value::List()},
  }));
  transaction.Create(ResourceType::kSecurityGroup, Value::Map({
                                                       {"GroupName", "default"},
                                                       {"Description", "default VPC security group"},
                                                       {"VpcId", vpc.id},
                                                       {"OwnerId", context.account_id},
                                                       {"IpPermissions", Value::List()},
                                                       {"IpPermissionsEgress", std::move(egress)},
                                                   }));

  auto routes = Value::List();
  routes.Append(Value::Map({
      {"DestinationCidrBlock", cidr},
      {"GatewayId", "local"},
      {"State", "active"},
      {"Origin", "CreateRouteTable"},
  }));
  auto associations = Value::List();
  associations.Append(Value::Map({
      {"Main", true},
      {"RouteTableAssociationId", util::MakeId("rtbassoc", 17)},
      {"AssociationState", Value::Map({{"State", "associated"}})},
  }));
  const auto table = transaction.Create(ResourceType::kRouteTable, Value::Map({
                                                                       {"VpcId", vpc.id},
                                                                       {"OwnerId", context.account_id},
                                                                       {"Routes", std::move(routes)},
                                                                       {"Associations", std::move(associations)},
                                                                       {"PropagatingVgws", Value::List()},
                                                                   }));
  transaction.Update(ResourceType::kRouteTable, table.id, [&](model::Resource& resource) {
    resource.attributes.Find("Associations")->at(0).Set("RouteTableId", resource.id);
  });

  transaction.Create(ResourceType::kNetworkAcl, Value::Map({
                                                    {"VpcId", vpc.id},
                                                    {"IsDefault", true},
                                                    {"OwnerId", context.account_id},
                                                    {"Entries", DefaultAclEntries()},
                                                    {"Associations", Value::List()},
                                                }));
  return vpc;
}

model::Resource CreateSubnetChecked(store::StoreTransaction& transaction, const std::string& vpc_id, const util::Ipv4Cidr& cidr, const std::string& zone,
                                    std::vector<model::Tag> tags, const gateway::RequestContext& context, bool default_for_az) {
  const auto* vpc = transaction.Find(ResourceType::kVpc, vpc_id);
  if (!vpc) {
    throw util::NotFound(ResourceType::kVpc, vpc_id, "The vpc ID '" + vpc_id + "' does not exist");
  }
  const auto vpc_cidr = util::ParseIpv4Cidr(vpc->attributes.GetString("CidrBlock"));
  if (!vpc_cidr || !vpc_cidr->Contains(cidr)) {
    throw util::ValidationFailed("InvalidSubnet.Range", "The CIDR '" + cidr.ToString() + "' is invalid.");
  }
  for (const auto* other : transaction.List(ResourceType::kSubnet)) {
    if (other->attributes.GetString("VpcId") != vpc_id) continue;
    const auto other_cidr = util::ParseIpv4Cidr(other->attributes.GetString("CidrBlock"));
    if (other_cidr && other_cidr->Overlaps(cidr)) {
      throw util::ValidationFailed("InvalidSubnet.Conflict", "The CIDR '" + cidr.ToString() + "' conflicts with another subnet");
    }
  }

  auto attributes = NewSubnetAttributes(vpc_id, cidr, zone, context);
  if (default_for_az) {
    attributes.Set("DefaultForAz", true);
    attributes.Set("MapPublicIpOnLaunch", true);
  }
  const auto subnet = transaction.Create(ResourceType::kSubnet, std::move(attributes), std::move(tags));
  return transaction.Update(ResourceType::kSubnet, subnet.id, [&](model::Resource& resource) {
    resource.attributes.Set("SubnetArn", "arn:aws:ec2:" + context.region + ":" + context.account_id + ":subnet/" + resource.id);
  });
}

const model::Resource* FindDefaultSecurityGroup(const store::StoreView& view, const std::string& vpc_id) {
  return FindInVpc(view, ResourceType::kSecurityGroup, vpc_id,
                   [](const model::Resource& group) { return group.attributes.GetString("GroupName") == "default"; });
}

const model::Resource* FindMainRouteTable(const store::StoreView& view, const std::string& vpc_id) {
  return FindInVpc(view, ResourceType::kRouteTable, vpc_id, [](const model::Resource& table) {
    std::vector<std::string> main;
    model::CollectScalars(table.attributes, "Associations.Main", main);
    return std::find(main.begin(), main.end(), "true") != main.end();
  });
}

} // namespace vera::handlers
