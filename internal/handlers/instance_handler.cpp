#include "internal/handlers/instance_handler.hpp"

#include <algorithm>
#include <set>
#include <vector>

#include "internal/handlers/handler_util.hpp"
#include "internal/handlers/network_defaults.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cidr.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

constexpr std::string_view kRootDevice = "/dev/xvda";

Value StateValue(std::string_view name) {
  return Value::Map({{"Code", InstanceStateCode(name)}, {"Name", name}});
}

void SetState(model::Resource& instance, std::string_view name) {
  instance.state = std::string(name);
  instance.attributes.Set("State", StateValue(name));
}

std::string PrivateDnsName(const std::string& ip, const std::string& region) {
  std::string host = "ip-" + ip;
  std::replace(host.begin(), host.end(), '.', '-');
  return host + (region == "us-east-1" ? ".ec2.internal" : "." + region + ".compute.internal");
}

std::string PublicDnsName(const std::string& ip, const std::string& region) {
  std::string host = "ec2-" + ip;
  std::replace(host.begin(), host.end(), '.', '-');
  return host + (region == "us-east-1" ? ".compute-1.amazonaws.com" : "." + region + ".compute.amazonaws.com");
}

bool IsTrue(const Value* value) {
  return value && value->IsScalar() && value->ToText() == "true";
}

// Current copies of the requested instances; any unknown id fails the whole
// request before anything changes.
std::vector<model::Resource> RequireInstances(const store::StoreView& view, const std::vector<std::string>& ids) {
  std::vector<model::Resource> instances;
  instances.reserve(ids.size());
  for (const auto& id : ids) {
    instances.push_back(view.Get(ResourceType::kInstance, id));
  }
  return instances;
}

std::vector<std::string> RequireInstanceIds(const Value& params) {
  auto ids = StringList(params, "InstanceId");
  if (ids.empty()) {
    throw util::MalformedParameter("The request must contain the parameter InstanceId", "MissingParameter");
  }
  return ids;
}

Value StateChange(const std::string& id, std::string_view current, std::string_view previous) {
  return Value::Map({{"InstanceId", id}, {"CurrentState", StateValue(current)}, {"PreviousState", StateValue(previous)}});
}

} // namespace

int InstanceStateCode(std::string_view state) {
  if (state == "pending") return 0;
  if (state == "running") return 16;
  if (state == "shutting-down") return 32;
  if (state == "terminated") return 48;
  if (state == "stopping") return 64;
  if (state == "stopped") return 80;
  throw util::InternalError("unknown instance state '" + std::string(state) + "'");
}

InstanceHandler::InstanceHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("RunInstances", [this](const Value& p, const gateway::RequestContext& c) { return RunInstances(p, c); });
  On("DescribeInstances", [this](const Value& p, const gateway::RequestContext& c) { return DescribeInstances(p, c); });
  On("TerminateInstances", [this](const Value& p, const gateway::RequestContext& c) { return TerminateInstances(p, c); });
  On("StopInstances", [this](const Value& p, const gateway::RequestContext& c) { return StopInstances(p, c); });
  On("StartInstances", [this](const Value& p, const gateway::RequestContext& c) { return StartInstances(p, c); });
}

// ------------------------------------------------------------
// Launch
// ------------------------------------------------------------

Value InstanceHandler::RunInstances(const Value& params, const gateway::RequestContext& context) {
  const auto image_id  = RequireString(params, "ImageId");
  const auto min_count = OptionalInt(params, "MinCount").value_or(1);
  const auto max_count = OptionalInt(params, "MaxCount").value_or(min_count);
  if (min_count < 1 || max_count < min_count) {
    throw util::ValidationFailed("InvalidParameterValue", "Invalid value for MinCount/MaxCount: MinCount must be at least 1 and not greater than MaxCount");
  }

  const auto  key_name       = OptionalString(params, "KeyName");
  const auto  subnet_id      = OptionalString(params, "SubnetId");
  const auto  group_ids      = StringList(params, "SecurityGroupId");
  const auto  group_names    = StringList(params, "SecurityGroup");
  const auto  instance_type  = OptionalString(params, "InstanceType", "m1.small");
  const auto  client_token   = OptionalString(params, "ClientToken");
  const auto* requested_zone = params.FindPath("Placement.AvailabilityZone");
  const auto  tags           = TagsFor(params, "instance");

  const auto reservation_id = util::MakeId("r", 17);
  const auto launch_time    = util::FormatIso8601(util::Now());

  // The whole launch is one write: either every instance with its address
  // and root volume appears, or nothing does.
  std::vector<model::Resource> pending;
  std::string                  zone = context.region + "a";
  auto                         group_list = Value::List();
  store().Transact([&](store::StoreTransaction& transaction) {
    if (!key_name.empty()) {
      const auto keys  = transaction.List(ResourceType::kKeyPair);
      const bool known = std::any_of(keys.begin(), keys.end(), [&](const model::Resource* key) { return key->attributes.GetString("KeyName") == key_name; });
      if (!known) {
        throw util::NotFound(ResourceType::kKeyPair, key_name, "The key pair '" + key_name + "' does not exist");
      }
    }

    // Placement: explicit subnet, else a default subnet of the default VPC.
    const model::Resource* subnet = nullptr;
    if (!subnet_id.empty()) {
      subnet = &transaction.Get(ResourceType::kSubnet, subnet_id);
    } else if (const auto* vpc = FindDefaultVpc(transaction)) {
      for (const auto* candidate : transaction.List(ResourceType::kSubnet)) {
        if (candidate->attributes.GetString("VpcId") != vpc->id || !IsTrue(candidate->attributes.Find("DefaultForAz"))) continue;
        if (requested_zone && candidate->attributes.GetString("AvailabilityZone") != requested_zone->ToText()) continue;
        subnet = candidate;
        break;
      }
    }

    if (subnet) {
      zone = subnet->attributes.GetString("AvailabilityZone");
    } else if (requested_zone) {
      zone = requested_zone->ToText();
      if (!IsAvailabilityZone(context.region, zone)) {
        throw util::ValidationFailed("InvalidParameterValue", "Invalid availability zone: [" + zone + "]");
      }
    }
    const auto vpc_id = subnet ? subnet->attributes.GetString("VpcId") : std::string();

    std::vector<const model::Resource*> groups;
    for (const auto& group_id : group_ids) {
      groups.push_back(&transaction.Get(ResourceType::kSecurityGroup, group_id));
    }
    if (!group_names.empty()) {
      const auto all = transaction.List(ResourceType::kSecurityGroup);
      for (const auto& name : group_names) {
        auto it = std::find_if(all.begin(), all.end(), [&](const model::Resource* group) {
          return group->attributes.GetString("GroupName") == name && (vpc_id.empty() || group->attributes.GetString("VpcId") == vpc_id);
        });
        if (it == all.end()) {
          throw util::NotFound(ResourceType::kSecurityGroup, name, "The security group '" + name + "' does not exist");
        }
        groups.push_back(*it);
      }
    }
    if (groups.empty() && !vpc_id.empty()) {
      if (const auto* fallback = FindDefaultSecurityGroup(transaction, vpc_id)) groups.push_back(fallback);
    }
    for (const auto* group : groups) {
      group_list.Append(Value::Map({{"GroupId", group->id}, {"GroupName", group->attributes.GetString("GroupName")}}));
    }

    auto count = max_count;
    if (subnet) {
      const auto available = subnet->attributes.Find("AvailableIpAddressCount")->AsInt();
      if (available < min_count) {
        throw util::ValidationFailed("InsufficientFreeAddressesInSubnet",
                                     "There are not enough free addresses in subnet '" + subnet->id + "' to satisfy the requested number of instances.");
      }
      count = std::min(max_count, available);
    }
    const bool        public_ip        = subnet && IsTrue(subnet->attributes.Find("MapPublicIpOnLaunch"));
    const std::string placed_subnet_id = subnet ? subnet->id : std::string();

    for (std::int64_t index = 0; index < count; ++index) {
      auto attributes = Value::Map({
          {"ImageId", image_id},
          {"InstanceType", instance_type},
          {"LaunchTime", launch_time},
          {"Placement", Value::Map({{"AvailabilityZone", zone}, {"GroupName", ""}, {"Tenancy", "default"}})},
          {"Monitoring", Value::Map({{"State", "disabled"}})},
          {"Architecture", "x86_64"},
          {"RootDeviceType", "ebs"},
          {"RootDeviceName", kRootDevice},
          {"VirtualizationType", "hvm"},
          {"Hypervisor", "xen"},
          {"AmiLaunchIndex", index},
          {"EbsOptimized", false},
          {"ReservationId", reservation_id},
          {"OwnerId", context.account_id},
          {"SecurityGroups", group_list},
          {"ClientToken", client_token},
      });
      attributes.Set("State", StateValue("pending"));
      if (!key_name.empty()) attributes.Set("KeyName", key_name);

      if (!placed_subnet_id.empty()) {
        const auto ip = AllocatePrivateIp(transaction, placed_subnet_id);
        attributes.Set("SubnetId", placed_subnet_id);
        attributes.Set("VpcId", vpc_id);
        attributes.Set("PrivateIpAddress", ip);
        attributes.Set("PrivateDnsName", PrivateDnsName(ip, context.region));
        attributes.Set("SourceDestCheck", true);
      }
      if (public_ip) {
        const auto ip = RandomPublicIp();
        attributes.Set("PublicIpAddress", ip);
        attributes.Set("PublicDnsName", PublicDnsName(ip, context.region));
      }

      pending.push_back(transaction.Create(ResourceType::kInstance, std::move(attributes), tags));
      CreateRootVolume(transaction, pending.back(), zone);
      transaction.Update(ResourceType::kInstance, pending.back().id, [](model::Resource& instance) { SetState(instance, "running"); });
    }
  });

  auto launched = Value::List();
  for (const auto& instance : pending) {
    launched.Append(RenderInstance(instance));
    VERA_LOG_DEBUG("instance launched", {observability::StringField("instance_id", instance.id),
                                         observability::StringField("reservation_id", reservation_id), observability::StringField("zone", zone)});
  }

  return Value::Map({
      {"ReservationId", reservation_id},
      {"OwnerId", context.account_id},
      {"Groups", std::move(group_list)},
      {"Instances", std::move(launched)},
  });
}

std::string InstanceHandler::AllocatePrivateIp(store::StoreTransaction& transaction, const std::string& subnet_id) {
  std::set<std::string> taken;
  for (const auto* instance : transaction.List(ResourceType::kInstance)) {
    if (instance->state == "terminated" || instance->attributes.GetString("SubnetId") != subnet_id) continue;
    taken.insert(instance->attributes.GetString("PrivateIpAddress"));
  }

  std::string ip;
  transaction.Update(ResourceType::kSubnet, subnet_id, [&](model::Resource& subnet) {
    const auto cidr      = util::ParseIpv4Cidr(subnet.attributes.GetString("CidrBlock"));
    const auto available = subnet.attributes.Find("AvailableIpAddressCount")->AsInt();
    if (!cidr || available <= 0) {
      throw util::ValidationFailed("InsufficientFreeAddressesInSubnet", "There are not enough free addresses in subnet '" + subnet.id + "'");
    }
    // Usable addresses run from .4 to the one before broadcast.
    const auto usable = static_cast<std::uint32_t>(cidr->Size()) - 5;
    for (std::uint32_t offset = 0; offset < usable && ip.empty(); ++offset) {
      auto candidate = util::FormatIpv4(cidr->network + 4 + offset);
      if (!taken.contains(candidate)) ip = std::move(candidate);
    }
    if (ip.empty()) {
      throw util::InternalError("subnet " + subnet.id + " reports free addresses but none is unused");
    }
    subnet.attributes.Set("AvailableIpAddressCount", available - 1);
  });
  return ip;
}

void InstanceHandler::ReleasePrivateIp(store::StoreTransaction& transaction, const model::Resource& instance) {
  const auto subnet_id = instance.attributes.GetString("SubnetId");
  if (subnet_id.empty() || !transaction.Find(ResourceType::kSubnet, subnet_id)) return;

  transaction.Update(ResourceType::kSubnet, subnet_id, [](model::Resource& subnet) {
    const auto available = subnet.attributes.Find("AvailableIpAddressCount")->AsInt();
    subnet.attributes.Set("AvailableIpAddressCount", available + 1);
  });
}

void InstanceHandler::CreateRootVolume(store::StoreTransaction& transaction, const model::Resource& instance, const std::string& zone) {
  const auto now = util::FormatIso8601(util::Now());

  auto attachments = Value::List();
  attachments.Append(Value::Map({
      {"InstanceId", instance.id},
      {"Device", kRootDevice},
      {"State", "attached"},
      {"AttachTime", now},
      {"DeleteOnTermination", true},
  }));
  const auto volume = transaction.Create(ResourceType::kVolume, Value::Map({
                                                                    {"AvailabilityZone", zone},
                                                                    {"Size", 8},
                                                                    {"SnapshotId", ""},
                                                                    {"VolumeType", "gp2"},
                                                                    {"Iops", 100},
                                                                    {"Encrypted", false},
                                                                    {"CreateTime", now},
                                                                    {"MultiAttachEnabled", false},
                                                                    {"Attachments", std::move(attachments)},
                                                                }));
  transaction.Update(ResourceType::kVolume, volume.id, [](model::Resource& resource) {
    resource.state = "in-use";
    resource.attributes.Find("Attachments")->at(0).Set("VolumeId", resource.id);
  });
}

// ------------------------------------------------------------
// Describe
// ------------------------------------------------------------

Value InstanceHandler::RenderInstance(const model::Resource& instance) const {
  auto body = Render(instance);
  body.Erase("ReservationId");
  body.Erase("OwnerId");

  auto mappings = Value::List();
  for (const auto& referrer_id : store().ReferencersOf(instance.id)) {
    const auto volume = store().Lookup(referrer_id);
    if (!volume || volume->type != ResourceType::kVolume) continue;

    const auto* attachments = volume->attributes.Find("Attachments");
    for (std::size_t i = 0; attachments && i < attachments->size(); ++i) {
      const auto& attachment = attachments->at(i);
      if (attachment.GetString("InstanceId") != instance.id) continue;
      mappings.Append(Value::Map({
          {"DeviceName", attachment.GetString("Device")},
          {"Ebs", Value::Map({
                      {"VolumeId", volume->id},
                      {"Status", attachment.GetString("State")},
                      {"AttachTime", attachment.GetString("AttachTime")},
                      {"DeleteOnTermination", IsTrue(attachment.Find("DeleteOnTermination"))},
                  })},
      }));
    }
  }
  body.Set("BlockDeviceMappings", std::move(mappings));
  return body;
}

Value InstanceHandler::DescribeInstances(const Value& params, const gateway::RequestContext&) {
  const auto instances = DescribeResources(store(), filters(), ResourceType::kInstance, StringList(params, "InstanceId"), params);

  // One reservation entry per launch, in order of first appearance.
  auto                     reservations = Value::List();
  std::vector<std::string> seen;
  for (const auto& instance : instances) {
    const auto reservation_id = instance.attributes.GetString("ReservationId");
    auto       it             = std::find(seen.begin(), seen.end(), reservation_id);
    if (it == seen.end()) {
      reservations.Append(Value::Map({
          {"ReservationId", reservation_id},
          {"OwnerId", instance.attributes.GetString("OwnerId")},
          {"Groups", Value::List()},
          {"Instances", Value::List()},
      }));
      seen.push_back(reservation_id);
      it = seen.end() - 1;
    }
    reservations.at(static_cast<std::size_t>(it - seen.begin())).Find("Instances")->Append(RenderInstance(instance));
  }
  return Value::Map({{"Reservations", std::move(reservations)}});
}

// ------------------------------------------------------------
// State changes
// ------------------------------------------------------------

void InstanceHandler::ReleaseAttachments(store::StoreTransaction& transaction, const std::string& instance_id) {
  for (const auto& referrer_id : transaction.ReferencersOf(instance_id)) {
    const auto* referrer = transaction.FindAny(referrer_id);
    if (!referrer) continue;

    if (referrer->type == ResourceType::kVolume) {
      const auto* attachments = referrer->attributes.Find("Attachments");
      const bool  doomed      = attachments && attachments->size() > 0 && IsTrue(attachments->at(0).Find("DeleteOnTermination"));
      if (doomed) {
        transaction.Delete(ResourceType::kVolume, referrer_id);
      } else {
        transaction.Update(ResourceType::kVolume, referrer_id, [](model::Resource& volume) {
          volume.state = "available";
          volume.attributes.Set("Attachments", Value::List());
        });
      }
    } else if (referrer->type == ResourceType::kElasticIp) {
      transaction.Update(ResourceType::kElasticIp, referrer_id, [](model::Resource& address) {
        address.attributes.Erase("InstanceId");
        address.attributes.Erase("AssociationId");
        address.attributes.Erase("PrivateIpAddress");
      });
    }
  }
}

Value InstanceHandler::TerminateInstances(const Value& params, const gateway::RequestContext&) {
  const auto ids = RequireInstanceIds(params);

  auto changes = Value::List();
  store().Transact([&](store::StoreTransaction& transaction) {
    RequireInstances(transaction, ids);
    for (const auto& id : ids) {
      const auto instance = transaction.Get(ResourceType::kInstance, id);
      if (instance.state == "terminated") {
        changes.Append(StateChange(id, instance.state, instance.state));
        continue;
      }

      ReleaseAttachments(transaction, id);
      ReleasePrivateIp(transaction, instance);
      transaction.Update(ResourceType::kInstance, id, [](model::Resource& resource) {
        SetState(resource, "terminated");
        resource.attributes.Erase("PublicIpAddress");
        resource.attributes.Set("PublicDnsName", "");
      });
      changes.Append(StateChange(id, "shutting-down", instance.state));
    }
  });
  return Value::Map({{"TerminatingInstances", std::move(changes)}});
}

Value InstanceHandler::StopInstances(const Value& params, const gateway::RequestContext&) {
  const auto ids = RequireInstanceIds(params);

  auto changes = Value::List();
  store().Transact([&](store::StoreTransaction& transaction) {
    const auto instances = RequireInstances(transaction, ids);
    for (const auto& instance : instances) {
      if (instance.state == "terminated" || instance.state == "shutting-down") {
        throw util::ValidationFailed("IncorrectInstanceState", "This instance '" + instance.id + "' is not in a state from which it can be stopped.");
      }
    }

    for (const auto& instance : instances) {
      if (instance.state == "stopped" || instance.state == "stopping") {
        changes.Append(StateChange(instance.id, instance.state, instance.state));
        continue;
      }
      transaction.Update(ResourceType::kInstance, instance.id, [](model::Resource& resource) { SetState(resource, "stopped"); });
      changes.Append(StateChange(instance.id, "stopping", instance.state));
    }
  });
  return Value::Map({{"StoppingInstances", std::move(changes)}});
}

Value InstanceHandler::StartInstances(const Value& params, const gateway::RequestContext&) {
  const auto ids = RequireInstanceIds(params);

  auto changes = Value::List();
  store().Transact([&](store::StoreTransaction& transaction) {
    const auto instances = RequireInstances(transaction, ids);
    for (const auto& instance : instances) {
      if (instance.state == "terminated" || instance.state == "shutting-down" || instance.state == "stopping") {
        throw util::ValidationFailed("IncorrectInstanceState", "The instance '" + instance.id + "' is not in a state from which it can be started.");
      }
    }

    for (const auto& instance : instances) {
      if (instance.state == "running" || instance.state == "pending") {
        changes.Append(StateChange(instance.id, instance.state, instance.state));
        continue;
      }
      transaction.Update(ResourceType::kInstance, instance.id, [](model::Resource& resource) { SetState(resource, "running"); });
      changes.Append(StateChange(instance.id, "pending", instance.state));
    }
  });
  return Value::Map({{"StartingInstances", std::move(changes)}});
}

} // namespace vera::handlers
