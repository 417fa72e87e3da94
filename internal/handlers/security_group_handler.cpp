#include "internal/handlers/security_group_handler.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <tuple>
#include <vector>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/cidr.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

struct Rule {
  std::string                 protocol;
  std::optional<std::int64_t> from_port;
  std::optional<std::int64_t> to_port;
  std::string                 cidr;

  bool SameRange(const Rule& other) const {
    return std::tie(protocol, from_port, to_port) == std::tie(other.protocol, other.from_port, other.to_port);
  }

  std::string Describe() const {
    std::string text = "peer: " + cidr + ", " + protocol;
    if (from_port) text += ", from port: " + std::to_string(*from_port);
    if (to_port) text += ", to port: " + std::to_string(*to_port);
    return text + ", ALLOW";
  }
};

std::string NormalizeProtocol(std::string protocol) {
  std::transform(protocol.begin(), protocol.end(), protocol.begin(), [](unsigned char c) { return std::tolower(c); });
  if (protocol == "all" || protocol == "-1") return "-1";
  if (protocol == "6") return "tcp";
  if (protocol == "17") return "udp";
  if (protocol == "1") return "icmp";
  if (protocol == "tcp" || protocol == "udp" || protocol == "icmp") return protocol;
  throw util::ValidationFailed("InvalidParameterValue", "Invalid value '" + protocol + "' for IP protocol. Unknown protocol.");
}

Rule MakeRule(const Value& source, std::string cidr) {
  Rule rule;
  rule.protocol = NormalizeProtocol(RequireString(source, "IpProtocol"));
  if (rule.protocol != "-1") {
    rule.from_port = OptionalInt(source, "FromPort");
    rule.to_port   = OptionalInt(source, "ToPort");
    if (!rule.from_port || !rule.to_port) {
      throw util::ValidationFailed("InvalidParameterValue", "Invalid value for portRange. Must specify both from and to ports with TCP/UDP.");
    }
  }
  if (!util::ParseIpv4Cidr(cidr)) {
    throw util::ValidationFailed("InvalidParameterValue", "CIDR block " + cidr + " is malformed");
  }
  rule.cidr = std::move(cidr);
  return rule;
}

// IpPermissions.N.IpRanges.M.CidrIp, or the flat IpProtocol/FromPort/ToPort/
// CidrIp form older clients send.
std::vector<Rule> ParseRules(const Value& params) {
  std::vector<Rule> rules;
  if (const auto* permissions = params.Find("IpPermissions"); permissions && permissions->IsList()) {
    for (std::size_t i = 0; i < permissions->size(); ++i) {
      const auto& permission = permissions->at(i);
      const auto* ranges     = permission.Find("IpRanges");
      if (!ranges || !ranges->IsList() || ranges->size() == 0) {
        throw util::ValidationFailed("InvalidParameterValue", "Each IP permission must specify at least one IpRanges entry");
      }
      for (std::size_t j = 0; j < ranges->size(); ++j) {
        rules.push_back(MakeRule(permission, RequireString(ranges->at(j), "CidrIp")));
      }
    }
  } else if (params.Contains("IpProtocol")) {
    rules.push_back(MakeRule(params, RequireString(params, "CidrIp")));
  }
  if (rules.empty()) {
    throw util::MalformedParameter("The request must contain the parameter IpPermissions", "MissingParameter");
  }
  return rules;
}

std::vector<Rule> StoredRules(const Value& permissions) {
  std::vector<Rule> rules;
  for (std::size_t i = 0; i < permissions.size(); ++i) {
    const auto& permission = permissions.at(i);
    std::vector<std::string> cidrs;
    model::CollectScalars(permission, "IpRanges.CidrIp", cidrs);
    for (auto& cidr : cidrs) {
      Rule rule;
      rule.protocol = permission.GetString("IpProtocol");
      if (const auto* from = permission.Find("FromPort")) rule.from_port = from->AsInt();
      if (const auto* to = permission.Find("ToPort")) rule.to_port = to->AsInt();
      rule.cidr = std::move(cidr);
      rules.push_back(std::move(rule));
    }
  }
  return rules;
}

Value RenderPermissions(const std::vector<Rule>& rules) {
  auto permissions = Value::List();
  std::vector<const Rule*> heads;
  for (const auto& rule : rules) {
    auto it = std::find_if(heads.begin(), heads.end(), [&](const Rule* head) { return head->SameRange(rule); });
    if (it == heads.end()) {
      auto permission = Value::Map({{"IpProtocol", rule.protocol}});
      if (rule.from_port) permission.Set("FromPort", *rule.from_port);
      if (rule.to_port) permission.Set("ToPort", *rule.to_port);
      permission.Set("IpRanges", Value::List());
      permission.Set("UserIdGroupPairs", Value::List());
      permissions.Append(std::move(permission));
      heads.push_back(&rule);
      it = heads.end() - 1;
    }
    auto& permission = permissions.at(static_cast<std::size_t>(it - heads.begin()));
    permission.Find("IpRanges")->Append(Value::Map({{"CidrIp", rule.cidr}}));
  }
  return permissions;
}

std::string_view PermissionsKey(bool egress) {
  return egress ? "IpPermissionsEgress" : "IpPermissions";
}

} // namespace

SecurityGroupHandler::SecurityGroupHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateSecurityGroup", [this](const Value& p, const gateway::RequestContext& c) { return CreateSecurityGroup(p, c); });
  On("DescribeSecurityGroups", [this](const Value& p, const gateway::RequestContext& c) { return DescribeSecurityGroups(p, c); });
  On("DeleteSecurityGroup", [this](const Value& p, const gateway::RequestContext& c) { return DeleteSecurityGroup(p, c); });
  On("AuthorizeSecurityGroupIngress", [this](const Value& p, const gateway::RequestContext&) { return Authorize(p, Direction::kIngress); });
  On("AuthorizeSecurityGroupEgress", [this](const Value& p, const gateway::RequestContext&) { return Authorize(p, Direction::kEgress); });
  On("RevokeSecurityGroupIngress", [this](const Value& p, const gateway::RequestContext&) { return Revoke(p, Direction::kIngress); });
  On("RevokeSecurityGroupEgress", [this](const Value& p, const gateway::RequestContext&) { return Revoke(p, Direction::kEgress); });
}

Value SecurityGroupHandler::CreateSecurityGroup(const Value& params, const gateway::RequestContext& context) {
  const auto name        = RequireString(params, "GroupName");
  const auto description = RequireString(params, "GroupDescription");

  auto vpc_id = OptionalString(params, "VpcId");
  if (vpc_id.empty()) {
    const auto vpc = FindDefaultVpc(store());
    if (!vpc) {
      throw util::ValidationFailed("VPCIdNotSpecified", "No default VPC for this user");
    }
    vpc_id = vpc->id;
  }

  auto egress   = Value::List();
  auto anywhere = Value::List();
  anywhere.Append(Value::Map({{"CidrIp", "0.0.0.0/0"}}));
  egress.Append(Value::Map({{"IpProtocol", "-1"}, {"IpRanges", std::move(anywhere)}, {"UserIdGroupPairs", Value::List()}}));

  auto attributes = Value::Map({
      {"GroupName", name},
      {"Description", description},
      {"VpcId", vpc_id},
      {"OwnerId", context.account_id},
      {"IpPermissions", Value::List()},
      {"IpPermissionsEgress", std::move(egress)},
  });

  const auto group = store().Create(ResourceType::kSecurityGroup, std::move(attributes), TagsFor(params, "security-group"), [&](const store::StoreView& view) {
    for (const auto* existing : view.List(ResourceType::kSecurityGroup)) {
      if (existing->attributes.GetString("VpcId") == vpc_id && existing->attributes.GetString("GroupName") == name) {
        throw util::ValidationFailed("InvalidGroup.Duplicate", "The security group '" + name + "' already exists for VPC '" + vpc_id + "'");
      }
    }
  });

  auto body = Value::Map({{"GroupId", group.id}});
  if (!group.tags.empty()) body.Set("Tags", RenderTags(group.tags));
  return body;
}

Value SecurityGroupHandler::DescribeSecurityGroups(const Value& params, const gateway::RequestContext&) {
  auto ids = StringList(params, "GroupId");

  // Names resolve within the default VPC, then join the explicit id list.
  const auto names = StringList(params, "GroupName");
  if (!names.empty()) {
    const auto vpc    = FindDefaultVpc(store());
    const auto groups = store().List(ResourceType::kSecurityGroup);
    for (const auto& name : names) {
      auto it = std::find_if(groups.begin(), groups.end(), [&](const model::Resource& group) {
        return group.attributes.GetString("GroupName") == name && (!vpc || group.attributes.GetString("VpcId") == vpc->id);
      });
      if (it == groups.end()) {
        throw util::NotFound(ResourceType::kSecurityGroup, name, "The security group '" + name + "' does not exist in default VPC");
      }
      ids.push_back(it->id);
    }
  }

  auto list = Value::List();
  for (const auto& group : DescribeResources(store(), filters(), ResourceType::kSecurityGroup, ids, params)) {
    list.Append(Render(group));
  }
  return Value::Map({{"SecurityGroups", std::move(list)}});
}

Value SecurityGroupHandler::DeleteSecurityGroup(const Value& params, const gateway::RequestContext&) {
  const auto group_id = ResolveGroupId(params);

  store().Delete(ResourceType::kSecurityGroup, group_id, [&](const store::StoreView& view) {
    const auto* group = view.Find(ResourceType::kSecurityGroup, group_id);
    if (group && group->attributes.GetString("GroupName") == "default") {
      throw util::ValidationFailed("CannotDelete", "the specified group: \"" + group_id + "\" name: \"default\" cannot be deleted by a user");
    }
  });
  return ReturnTrue();
}

Value SecurityGroupHandler::Authorize(const Value& params, Direction direction) {
  const auto group_id = ResolveGroupId(params);
  const auto rules    = ParseRules(params);
  const auto key      = PermissionsKey(direction == Direction::kEgress);

  store().Update(ResourceType::kSecurityGroup, group_id, [&](model::Resource& group) {
    const auto* stored  = group.attributes.Find(key);
    auto        current = stored ? StoredRules(*stored) : std::vector<Rule>{};
    for (const auto& rule : rules) {
      const bool exists = std::any_of(current.begin(), current.end(), [&](const Rule& r) { return r.SameRange(rule) && r.cidr == rule.cidr; });
      if (exists) {
        throw util::ValidationFailed("InvalidPermission.Duplicate", "the specified rule \"" + rule.Describe() + "\" already exists");
      }
      current.push_back(rule);
    }
    group.attributes.Set(key, RenderPermissions(current));
  });
  return ReturnTrue();
}

Value SecurityGroupHandler::Revoke(const Value& params, Direction direction) {
  const auto group_id = ResolveGroupId(params);
  const auto rules    = ParseRules(params);
  const auto key      = PermissionsKey(direction == Direction::kEgress);

  store().Update(ResourceType::kSecurityGroup, group_id, [&](model::Resource& group) {
    const auto* stored  = group.attributes.Find(key);
    auto        current = stored ? StoredRules(*stored) : std::vector<Rule>{};
    for (const auto& rule : rules) {
      auto it = std::find_if(current.begin(), current.end(), [&](const Rule& r) { return r.SameRange(rule) && r.cidr == rule.cidr; });
      if (it == current.end()) {
        throw util::ValidationFailed("InvalidPermission.NotFound", "The specified rule does not exist in this security group.");
      }
      current.erase(it);
    }
    group.attributes.Set(key, RenderPermissions(current));
  });
  return ReturnTrue();
}

std::string SecurityGroupHandler::ResolveGroupId(const Value& params) const {
  const auto group_id = OptionalString(params, "GroupId");
  if (!group_id.empty()) return group_id;

  const auto name = OptionalString(params, "GroupName");
  if (name.empty()) {
    throw util::MalformedParameter("The request must contain the parameter groupName or groupId", "MissingParameter");
  }
  const auto vpc = FindDefaultVpc(store());
  for (const auto& group : store().List(ResourceType::kSecurityGroup)) {
    if (group.attributes.GetString("GroupName") == name && (!vpc || group.attributes.GetString("VpcId") == vpc->id)) {
      return group.id;
    }
  }
  throw util::NotFound(ResourceType::kSecurityGroup, name, "The security group '" + name + "' does not exist in default VPC");
}

} // namespace vera::handlers
