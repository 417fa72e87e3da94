#include "internal/handlers/internet_gateway_handler.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

InternetGatewayHandler::InternetGatewayHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateInternetGateway", [this](const Value& p, const gateway::RequestContext& c) { return CreateInternetGateway(p, c); });
  On("DescribeInternetGateways", [this](const Value& p, const gateway::RequestContext& c) { return DescribeInternetGateways(p, c); });
  On("DeleteInternetGateway", [this](const Value& p, const gateway::RequestContext& c) { return DeleteInternetGateway(p, c); });
  On("AttachInternetGateway", [this](const Value& p, const gateway::RequestContext& c) { return AttachInternetGateway(p, c); });
  On("DetachInternetGateway", [this](const Value& p, const gateway::RequestContext& c) { return DetachInternetGateway(p, c); });
}

Value InternetGatewayHandler::CreateInternetGateway(const Value& params, const gateway::RequestContext& context) {
  const auto igw = store().Create(ResourceType::kInternetGateway, Value::Map({{"OwnerId", context.account_id}, {"Attachments", Value::List()}}),
                                  TagsFor(params, "internet-gateway"));
  return Value::Map({{"InternetGateway", Render(igw)}});
}

Value InternetGatewayHandler::DescribeInternetGateways(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& igw :
       DescribeResources(store(), filters(), ResourceType::kInternetGateway, StringList(params, "InternetGatewayId"), params)) {
    list.Append(Render(igw));
  }
  return Value::Map({{"InternetGateways", std::move(list)}});
}

Value InternetGatewayHandler::DeleteInternetGateway(const Value& params, const gateway::RequestContext&) {
  const auto gateway_id = RequireString(params, "InternetGatewayId");

  store().Delete(ResourceType::kInternetGateway, gateway_id, [&](const store::StoreView& view) {
    const auto* igw         = view.Find(ResourceType::kInternetGateway, gateway_id);
    const auto* attachments = igw ? igw->attributes.Find("Attachments") : nullptr;
    if (attachments && attachments->size() > 0) {
      throw util::DependencyViolation("The internetGateway '" + gateway_id + "' has dependencies and cannot be deleted.");
    }
  });
  return ReturnTrue();
}

Value InternetGatewayHandler::AttachInternetGateway(const Value& params, const gateway::RequestContext&) {
  const auto gateway_id = RequireString(params, "InternetGatewayId");
  const auto vpc_id     = RequireString(params, "VpcId");

  store().Transact([&](store::StoreTransaction& transaction) {
    (void)transaction.Get(ResourceType::kInternetGateway, gateway_id);
    // A VPC takes at most one internet gateway.
    for (const auto* other : transaction.List(ResourceType::kInternetGateway)) {
      std::vector<std::string> attached;
      model::CollectScalars(other->attributes, "Attachments.VpcId", attached);
      if (other->id != gateway_id && std::find(attached.begin(), attached.end(), vpc_id) != attached.end()) {
        throw util::ValidationFailed("Resource.AlreadyAssociated", "network " + vpc_id + " already has an internet gateway attached");
      }
    }

    transaction.Update(ResourceType::kInternetGateway, gateway_id, [&](model::Resource& igw) {
      auto* attachments = igw.attributes.Find("Attachments");
      if (attachments->size() > 0) {
        throw util::ValidationFailed("Resource.AlreadyAssociated",
                                     "resource " + gateway_id + " is already attached to network " + attachments->at(0).GetString("VpcId"));
      }
      attachments->Append(Value::Map({{"VpcId", vpc_id}, {"State", "available"}}));
    });
  });
  return ReturnTrue();
}

Value InternetGatewayHandler::DetachInternetGateway(const Value& params, const gateway::RequestContext&) {
  const auto gateway_id = RequireString(params, "InternetGatewayId");
  const auto vpc_id     = RequireString(params, "VpcId");

  store().Update(ResourceType::kInternetGateway, gateway_id, [&](model::Resource& igw) {
    const auto* attachments = igw.attributes.Find("Attachments");
    if (attachments->size() == 0 || attachments->at(0).GetString("VpcId") != vpc_id) {
      throw util::ValidationFailed("Gateway.NotAttached", "resource " + gateway_id + " is not attached to network " + vpc_id);
    }
    igw.attributes.Set("Attachments", Value::List());
  });
  return ReturnTrue();
}

} // namespace vera::handlers
