#include "internal/handlers/vpc_handler.hpp"

#include <array>

#include "internal/handlers/handler_util.hpp"
#include "internal/handlers/network_defaults.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cidr.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 2> kDnsAttributes{{
    {"enableDnsSupport", "EnableDnsSupport"},
    {"enableDnsHostnames", "EnableDnsHostnames"},
}};

// DNS switches are readable through DescribeVpcAttribute only.
Value RenderVpc(const model::Resource& vpc) {
  auto body = Render(vpc);
  for (const auto& [wire, member] : kDnsAttributes) {
    body.Erase(member);
  }
  return body;
}

util::Ipv4Cidr ParseVpcCidr(const std::string& text) {
  const auto cidr = util::ParseIpv4Cidr(text);
  if (!cidr) {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + text + ") for parameter cidrBlock is invalid. This is not a valid CIDR block.");
  }
  if (cidr->prefix < 16 || cidr->prefix > 28) {
    throw util::ValidationFailed("InvalidVpc.Range", "The CIDR '" + text + "' is invalid.");
  }
  return *cidr;
}

} // namespace

VpcHandler::VpcHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateVpc", [this](const Value& p, const gateway::RequestContext& c) { return CreateVpc(p, c); });
  On("CreateDefaultVpc", [this](const Value& p, const gateway::RequestContext& c) { return CreateDefaultVpc(p, c); });
  On("DescribeVpcs", [this](const Value& p, const gateway::RequestContext& c) { return DescribeVpcs(p, c); });
  On("DeleteVpc", [this](const Value& p, const gateway::RequestContext& c) { return DeleteVpc(p, c); });
  On("ModifyVpcAttribute", [this](const Value& p, const gateway::RequestContext& c) { return ModifyVpcAttribute(p, c); });
  On("DescribeVpcAttribute", [this](const Value& p, const gateway::RequestContext& c) { return DescribeVpcAttribute(p, c); });
}

Value VpcHandler::CreateVpc(const Value& params, const gateway::RequestContext& context) {
  const auto cidr    = ParseVpcCidr(RequireString(params, "CidrBlock"));
  const auto tenancy = OptionalString(params, "InstanceTenancy", "default");
  if (tenancy != "default" && tenancy != "dedicated") {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + tenancy + ") for parameter instanceTenancy is invalid.");
  }

  auto            tags = TagsFor(params, "vpc");
  model::Resource vpc;
  store().Transact([&](store::StoreTransaction& transaction) {
    vpc = CreateVpcWithDefaults(transaction, NewVpcAttributes(cidr, tenancy, false, context), std::move(tags), context);
  });
  return Value::Map({{"Vpc", RenderVpc(vpc)}});
}

/*
  The default VPC is 172.31.0.0/16 with one /20 default subnet per zone, an
  attached internet gateway and a 0.0.0.0/0 route to it in the main table.
*/
Value VpcHandler::CreateDefaultVpc(const Value&, const gateway::RequestContext& context) {
  const auto cidr = *util::ParseIpv4Cidr("172.31.0.0/16");

  model::Resource vpc;
  store().Transact([&](store::StoreTransaction& transaction) {
    if (FindDefaultVpc(transaction)) {
      throw util::ValidationFailed("DefaultVpcAlreadyExists", "A Default VPC already exists for this account in this region.");
    }
    vpc = CreateVpcWithDefaults(transaction, NewVpcAttributes(cidr, "default", true, context), {}, context);

    std::uint32_t network = cidr.network;
    for (const auto& zone : AvailabilityZones(context.region)) {
      CreateSubnetChecked(transaction, vpc.id, util::Ipv4Cidr{network, 20}, zone, {}, context, true);
      network += 1u << 12;
    }

    auto attachments = Value::List();
    attachments.Append(Value::Map({{"VpcId", vpc.id}, {"State", "available"}}));
    const auto igw = transaction.Create(ResourceType::kInternetGateway, Value::Map({
                                                                            {"OwnerId", context.account_id},
                                                                            {"Attachments", std::move(attachments)},
                                                                        }));

    if (const auto* table = FindMainRouteTable(transaction, vpc.id)) {
      transaction.Update(ResourceType::kRouteTable, std::string(table->id), [&](model::Resource& resource) {
        resource.attributes.Find("Routes")->Append(Value::Map({
            {"DestinationCidrBlock", "0.0.0.0/0"},
            {"GatewayId", igw.id},
            {"State", "active"},
            {"Origin", "CreateRoute"},
        }));
      });
    }
  });

  VERA_LOG_INFO("default vpc created", {observability::StringField("vpc_id", vpc.id), observability::StringField("region", context.region)});
  return Value::Map({{"Vpc", RenderVpc(vpc)}});
}

Value VpcHandler::DescribeVpcs(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& vpc : DescribeResources(store(), filters(), ResourceType::kVpc, StringList(params, "VpcId"), params)) {
    list.Append(RenderVpc(vpc));
  }
  return Value::Map({{"Vpcs", std::move(list)}});
}

Value VpcHandler::DeleteVpc(const Value& params, const gateway::RequestContext&) {
  store().Delete(ResourceType::kVpc, RequireString(params, "VpcId"));
  return ReturnTrue();
}

Value VpcHandler::ModifyVpcAttribute(const Value& params, const gateway::RequestContext&) {
  const auto vpc_id = RequireString(params, "VpcId");

  std::string_view member;
  bool             enabled = false;
  for (const auto& [wire, name] : kDnsAttributes) {
    const auto* attribute = params.Find(name);
    if (!attribute) continue;
    if (!member.empty()) {
      throw util::ValidationFailed("InvalidParameterCombination", "Fields for multiple attribute types specified: enableDnsSupport, enableDnsHostnames");
    }
    member  = name;
    enabled = attribute->IsMap() ? OptionalBool(*attribute, "Value", false) : OptionalBool(params, name, false);
  }
  if (member.empty()) {
    throw util::MalformedParameter("The request must contain the parameter EnableDnsSupport or EnableDnsHostnames", "MissingParameter");
  }

  store().Update(ResourceType::kVpc, vpc_id, [&](model::Resource& vpc) { vpc.attributes.Set(member, enabled); });
  return ReturnTrue();
}

Value VpcHandler::DescribeVpcAttribute(const Value& params, const gateway::RequestContext&) {
  const auto vpc_id    = RequireString(params, "VpcId");
  const auto attribute = RequireString(params, "Attribute");

  for (const auto& [wire, member] : kDnsAttributes) {
    if (wire != attribute) continue;
    const auto  vpc   = store().Get(ResourceType::kVpc, vpc_id);
    const auto* value = vpc.attributes.Find(member);
    const bool  on    = value && value->kind() == Value::Kind::kBool && value->AsBool();

    auto body = Value::Map({{"VpcId", vpc_id}});
    body.Set(member, Value::Map({{"Value", on}}));
    return body;
  }
  throw util::ValidationFailed("InvalidParameterValue", "Value (" + attribute + ") for parameter attribute is invalid. Unknown attribute.");
}

} // namespace vera::handlers
