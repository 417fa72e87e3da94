#include "internal/handlers/region_handler.hpp"

#include <algorithm>
#include <array>

#include "internal/handlers/handler_util.hpp"

namespace vera::handlers {

using model::Value;

namespace {

constexpr std::array<std::string_view, 17> kRegions{
    "af-south-1",     "ap-east-1",      "ap-northeast-1", "ap-northeast-2", "ap-south-1", "ap-southeast-1",
    "ap-southeast-2", "ca-central-1",   "eu-central-1",   "eu-north-1",     "eu-west-1",  "eu-west-2",
    "eu-west-3",      "sa-east-1",      "us-east-1",      "us-east-2",      "us-west-2",
};

bool Selected(const std::vector<std::string>& names, std::string_view name) {
  return names.empty() || std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

RegionHandler::RegionHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("DescribeRegions", [this](const Value& p, const gateway::RequestContext& c) { return DescribeRegions(p, c); });
  On("DescribeAvailabilityZones", [this](const Value& p, const gateway::RequestContext& c) { return DescribeAvailabilityZones(p, c); });
  On("DescribeAccountAttributes", [this](const Value& p, const gateway::RequestContext& c) { return DescribeAccountAttributes(p, c); });
}

Value RegionHandler::DescribeRegions(const Value& params, const gateway::RequestContext& context) {
  const auto names = StringList(params, "RegionName");

  auto list = Value::List();
  auto add  = [&](std::string_view region) {
    if (!Selected(names, region)) return;
    list.Append(Value::Map({
        {"RegionName", region},
        {"Endpoint", "ec2." + std::string(region) + ".amazonaws.com"},
        {"OptInStatus", "opt-in-not-required"},
    }));
  };
  for (const auto region : kRegions) {
    add(region);
  }
  if (std::find(kRegions.begin(), kRegions.end(), context.region) == kRegions.end()) {
    add(context.region);
  }
  return Value::Map({{"Regions", std::move(list)}});
}

Value RegionHandler::DescribeAvailabilityZones(const Value& params, const gateway::RequestContext& context) {
  const auto names = StringList(params, "ZoneName");

  auto list = Value::List();
  for (const auto& zone : AvailabilityZones(context.region)) {
    if (!Selected(names, zone)) continue;
    list.Append(Value::Map({
        {"ZoneName", zone},
        {"ZoneId", AvailabilityZoneId(zone)},
        {"ZoneType", "availability-zone"},
        {"State", "available"},
        {"RegionName", context.region},
        {"GroupName", context.region},
        {"NetworkBorderGroup", context.region},
        {"OptInStatus", "opt-in-not-required"},
        {"Messages", Value::List()},
    }));
  }
  return Value::Map({{"AvailabilityZones", std::move(list)}});
}

Value RegionHandler::DescribeAccountAttributes(const Value& params, const gateway::RequestContext&) {
  const auto names = StringList(params, "AttributeName");

  const auto default_vpc = FindDefaultVpc(store());
  const std::array<std::pair<std::string_view, std::string>, 6> attributes{{
      {"supported-platforms", "VPC"},
      {"default-vpc", default_vpc ? default_vpc->id : std::string("none")},
      {"max-instances", "20"},
      {"vpc-max-security-groups-per-interface", "5"},
      {"max-elastic-ips", "5"},
      {"vpc-max-elastic-ips", "5"},
  }};

  auto list = Value::List();
  for (const auto& [name, value] : attributes) {
    if (!Selected(names, name)) continue;
    auto values = Value::List();
    values.Append(Value::Map({{"AttributeValue", value}}));
    list.Append(Value::Map({{"AttributeName", name}, {"AttributeValues", std::move(values)}}));
  }
  return Value::Map({{"AccountAttributes", std::move(list)}});
}

// ------------------------------------------------------------
// Caller identity
// ------------------------------------------------------------

IdentityHandler::IdentityHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("GetCallerIdentity", [this](const Value& p, const gateway::RequestContext& c) { return GetCallerIdentity(p, c); });
}

Value IdentityHandler::GetCallerIdentity(const Value&, const gateway::RequestContext& context) {
  return Value::Map({
      {"UserId", context.account_id},
      {"Account", context.account_id},
      {"Arn", "arn:aws:iam::" + context.account_id + ":root"},
  });
}

} // namespace vera::handlers
