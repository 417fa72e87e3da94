#include "internal/handlers/address_handler.hpp"

#include <algorithm>
#include <vector>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

constexpr int kPublicIpAttempts = 8;

Value RenderAddress(const model::Resource& address) {
  auto body = Render(address);
  // The allocation id doubles as the public identifier of the address.
  body.Set("AllocationId", address.id);
  return body;
}

} // namespace

AddressHandler::AddressHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("AllocateAddress", [this](const Value& p, const gateway::RequestContext& c) { return AllocateAddress(p, c); });
  On("DescribeAddresses", [this](const Value& p, const gateway::RequestContext& c) { return DescribeAddresses(p, c); });
  On("ReleaseAddress", [this](const Value& p, const gateway::RequestContext& c) { return ReleaseAddress(p, c); });
  On("AssociateAddress", [this](const Value& p, const gateway::RequestContext& c) { return AssociateAddress(p, c); });
  On("DisassociateAddress", [this](const Value& p, const gateway::RequestContext& c) { return DisassociateAddress(p, c); });
}

Value AddressHandler::AllocateAddress(const Value& params, const gateway::RequestContext& context) {
  const auto domain = OptionalString(params, "Domain", "vpc");
  if (domain != "vpc" && domain != "standard") {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + domain + ") for parameter domain is invalid.");
  }

  auto            tags = TagsFor(params, "elastic-ip");
  model::Resource address;
  store().Transact([&](store::StoreTransaction& transaction) {
    const auto allocated = transaction.List(ResourceType::kElasticIp);
    for (int attempt = 0; attempt < kPublicIpAttempts; ++attempt) {
      const auto public_ip = RandomPublicIp();
      const bool in_use    = std::any_of(allocated.begin(), allocated.end(),
                                         [&](const model::Resource* other) { return other->attributes.GetString("PublicIp") == public_ip; });
      if (in_use) continue;

      address = transaction.Create(ResourceType::kElasticIp,
                                   Value::Map({
                                       {"PublicIp", public_ip},
                                       {"Domain", domain},
                                       {"PublicIpv4Pool", "amazon"},
                                       {"NetworkBorderGroup", context.region},
                                   }),
                                   std::move(tags));
      return;
    }
    throw util::InternalError("could not allocate a unique public address");
  });
  return RenderAddress(address);
}

Value AddressHandler::DescribeAddresses(const Value& params, const gateway::RequestContext&) {
  auto ids = StringList(params, "AllocationId");

  const auto public_ips = StringList(params, "PublicIp");
  if (!public_ips.empty()) {
    const auto all = store().List(ResourceType::kElasticIp);
    for (const auto& ip : public_ips) {
      auto it = std::find_if(all.begin(), all.end(), [&](const model::Resource& address) { return address.attributes.GetString("PublicIp") == ip; });
      if (it == all.end()) {
        throw util::ValidationFailed("InvalidAddress.NotFound", "Address '" + ip + "' not found.");
      }
      ids.push_back(it->id);
    }
  }

  auto list = Value::List();
  for (const auto& address : DescribeResources(store(), filters(), ResourceType::kElasticIp, ids, params)) {
    list.Append(RenderAddress(address));
  }
  return Value::Map({{"Addresses", std::move(list)}});
}

Value AddressHandler::ReleaseAddress(const Value& params, const gateway::RequestContext&) {
  const auto allocation_id = ResolveAllocationId(params);

  store().Delete(ResourceType::kElasticIp, allocation_id, [&](const store::StoreView& view) {
    const auto* address = view.Find(ResourceType::kElasticIp, allocation_id);
    if (address && address->attributes.Contains("AssociationId")) {
      throw util::ValidationFailed("InvalidIPAddress.InUse", "Address " + address->attributes.GetString("PublicIp") + " is in use.");
    }
  });
  return ReturnTrue();
}

Value AddressHandler::AssociateAddress(const Value& params, const gateway::RequestContext&) {
  const auto allocation_id = ResolveAllocationId(params);
  const auto instance_id   = RequireString(params, "InstanceId");
  const bool reassociate   = OptionalBool(params, "AllowReassociation", false);

  const auto association_id = util::MakeId("eipassoc", 17);
  store().Transact([&](store::StoreTransaction& transaction) {
    const auto& instance = transaction.Get(ResourceType::kInstance, instance_id);
    if (instance.state != "running" && instance.state != "stopped" && instance.state != "pending") {
      throw util::ValidationFailed("IncorrectInstanceState", "The instance '" + instance_id + "' is not in a valid state for this operation.");
    }
    const auto private_ip = instance.attributes.GetString("PrivateIpAddress");

    transaction.Update(ResourceType::kElasticIp, allocation_id, [&](model::Resource& address) {
      if (address.attributes.Contains("AssociationId") && !reassociate) {
        throw util::ValidationFailed("Resource.AlreadyAssociated", "resource " + allocation_id + " is already associated with associate-id " +
                                                                        address.attributes.GetString("AssociationId"));
      }
      address.attributes.Set("InstanceId", instance_id);
      address.attributes.Set("AssociationId", association_id);
      if (!private_ip.empty()) address.attributes.Set("PrivateIpAddress", private_ip);
    });
  });
  return Value::Map({{"AssociationId", association_id}});
}

Value AddressHandler::DisassociateAddress(const Value& params, const gateway::RequestContext&) {
  std::string allocation_id;
  if (const auto association_id = OptionalString(params, "AssociationId"); !association_id.empty()) {
    for (const auto& address : store().List(ResourceType::kElasticIp)) {
      if (address.attributes.GetString("AssociationId") == association_id) allocation_id = address.id;
    }
    if (allocation_id.empty()) {
      throw util::ValidationFailed("InvalidAssociationID.NotFound", "The association ID '" + association_id + "' does not exist");
    }
  } else {
    allocation_id = ResolveAllocationId(params);
  }

  store().Update(ResourceType::kElasticIp, allocation_id, [](model::Resource& address) {
    address.attributes.Erase("InstanceId");
    address.attributes.Erase("AssociationId");
    address.attributes.Erase("PrivateIpAddress");
  });
  return ReturnTrue();
}

std::string AddressHandler::ResolveAllocationId(const Value& params) const {
  if (auto allocation_id = OptionalString(params, "AllocationId"); !allocation_id.empty()) return allocation_id;

  const auto public_ip = OptionalString(params, "PublicIp");
  if (public_ip.empty()) {
    throw util::MalformedParameter("The request must contain the parameter AllocationId or PublicIp", "MissingParameter");
  }
  for (const auto& address : store().List(ResourceType::kElasticIp)) {
    if (address.attributes.GetString("PublicIp") == public_ip) return address.id;
  }
  throw util::ValidationFailed("InvalidAddress.NotFound", "Address '" + public_ip + "' not found.");
}

} // namespace vera::handlers
