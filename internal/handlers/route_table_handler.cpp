#include "internal/handlers/route_table_handler.hpp"

#include <algorithm>
#include <array>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/cidr.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

bool IsMainTable(const Value& attributes) {
  std::vector<std::string> main;
  model::CollectScalars(attributes, "Associations.Main", main);
  return std::find(main.begin(), main.end(), "true") != main.end();
}

// Index of the route for `destination`, or routes->size().
std::size_t FindRoute(const Value& routes, const std::string& destination) {
  for (std::size_t i = 0; i < routes.size(); ++i) {
    if (routes.at(i).GetString("DestinationCidrBlock") == destination) return i;
  }
  return routes.size();
}

// Route target members in the order the provider checks them.
constexpr std::array<std::string_view, 5> kRouteTargets{"GatewayId", "InstanceId", "NatGatewayId", "NetworkInterfaceId", "VpcPeeringConnectionId"};

} // namespace

RouteTableHandler::RouteTableHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateRouteTable", [this](const Value& p, const gateway::RequestContext& c) { return CreateRouteTable(p, c); });
  On("DescribeRouteTables", [this](const Value& p, const gateway::RequestContext& c) { return DescribeRouteTables(p, c); });
  On("DeleteRouteTable", [this](const Value& p, const gateway::RequestContext& c) { return DeleteRouteTable(p, c); });
  On("CreateRoute", [this](const Value& p, const gateway::RequestContext& c) { return CreateRoute(p, c); });
  On("DeleteRoute", [this](const Value& p, const gateway::RequestContext& c) { return DeleteRoute(p, c); });
}

Value RouteTableHandler::CreateRouteTable(const Value& params, const gateway::RequestContext& context) {
  const auto vpc = store().Get(ResourceType::kVpc, RequireString(params, "VpcId"));

  auto routes = Value::List();
  routes.Append(Value::Map({
      {"DestinationCidrBlock", vpc.attributes.GetString("CidrBlock")},
      {"GatewayId", "local"},
      {"State", "active"},
      {"Origin", "CreateRouteTable"},
  }));

  const auto table = store().Create(ResourceType::kRouteTable,
                                    Value::Map({
                                        {"VpcId", vpc.id},
                                        {"OwnerId", context.account_id},
                                        {"Routes", std::move(routes)},
                                        {"Associations", Value::List()},
                                        {"PropagatingVgws", Value::List()},
                                    }),
                                    TagsFor(params, "route-table"));
  return Value::Map({{"RouteTable", Render(table)}});
}

Value RouteTableHandler::DescribeRouteTables(const Value& params, const gateway::RequestContext&) {
  auto list = Value::List();
  for (const auto& table : DescribeResources(store(), filters(), ResourceType::kRouteTable, StringList(params, "RouteTableId"), params)) {
    list.Append(Render(table));
  }
  return Value::Map({{"RouteTables", std::move(list)}});
}

Value RouteTableHandler::DeleteRouteTable(const Value& params, const gateway::RequestContext&) {
  const auto table_id = RequireString(params, "RouteTableId");

  store().Delete(ResourceType::kRouteTable, table_id, [&](const store::StoreView& view) {
    const auto* table = view.Find(ResourceType::kRouteTable, table_id);
    if (table && IsMainTable(table->attributes)) {
      throw util::DependencyViolation("The routeTable '" + table_id + "' has dependencies and cannot be deleted.");
    }
  });
  return ReturnTrue();
}

Value RouteTableHandler::CreateRoute(const Value& params, const gateway::RequestContext&) {
  const auto table_id    = RequireString(params, "RouteTableId");
  const auto destination = RequireString(params, "DestinationCidrBlock");
  if (!util::ParseIpv4Cidr(destination)) {
    throw util::ValidationFailed("InvalidParameterValue", "Value (" + destination + ") for parameter destinationCidrBlock is invalid. This is not a valid CIDR block.");
  }

  auto route = Value::Map({{"DestinationCidrBlock", destination}});
  for (const auto member : kRouteTargets) {
    const auto target = OptionalString(params, member);
    if (target.empty()) continue;
    route.Set(member, target);
    break;
  }
  if (route.size() == 1) {
    throw util::MalformedParameter("The request must contain exactly one of gatewayId, natGatewayId, networkInterfaceId, vpcPeeringConnectionId or instanceId",
                                   "MissingParameter");
  }
  route.Set("State", "active");
  route.Set("Origin", "CreateRoute");

  // The target must still exist when the route is written.
  store().Transact([&](store::StoreTransaction& transaction) {
    if (const auto gateway_id = route.GetString("GatewayId"); gateway_id.starts_with("igw-")) {
      transaction.Get(ResourceType::kInternetGateway, gateway_id);
    } else if (const auto instance_id = route.GetString("InstanceId"); !instance_id.empty()) {
      transaction.Get(ResourceType::kInstance, instance_id);
    }

    transaction.Update(ResourceType::kRouteTable, table_id, [&](model::Resource& table) {
      auto* routes = table.attributes.Find("Routes");
      if (FindRoute(*routes, destination) != routes->size()) {
        throw util::ValidationFailed("RouteAlreadyExists", "The route identified by " + destination + " already exists.");
      }
      routes->Append(route);
    });
  });
  return ReturnTrue();
}

Value RouteTableHandler::DeleteRoute(const Value& params, const gateway::RequestContext&) {
  const auto table_id    = RequireString(params, "RouteTableId");
  const auto destination = RequireString(params, "DestinationCidrBlock");

  store().Update(ResourceType::kRouteTable, table_id, [&](model::Resource& table) {
    const auto* routes = table.attributes.Find("Routes");
    const auto  index  = FindRoute(*routes, destination);
    if (index == routes->size()) {
      throw util::ValidationFailed("InvalidRoute.NotFound", "no route with destination-cidr-block " + destination + " in route table " + table_id);
    }
    if (routes->at(index).GetString("GatewayId") == "local") {
      throw util::ValidationFailed("InvalidParameterValue", "cannot remove local route " + destination + " in route table " + table_id);
    }

    auto kept = Value::List();
    for (std::size_t i = 0; i < routes->size(); ++i) {
      if (i != index) kept.Append(routes->at(i));
    }
    table.attributes.Set("Routes", std::move(kept));
  });
  return ReturnTrue();
}

} // namespace vera::handlers
