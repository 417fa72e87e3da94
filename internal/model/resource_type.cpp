#include "internal/model/resource_type.hpp"

#include <algorithm>
#include <stdexcept>

namespace vera::model {

std::size_t SuffixLength(IdStyle style) {
  return style == IdStyle::kShort ? 8 : 17;
}

bool ResourceTypeDescriptor::IsValidState(std::string_view state) const {
  if (states.empty()) return state.empty();
  return std::find(states.begin(), states.end(), state) != states.end();
}

bool ResourceTypeDescriptor::IsTerminalState(std::string_view state) const {
  return std::find(terminal_states.begin(), terminal_states.end(), state) != terminal_states.end();
}

std::optional<std::string> ResourceTypeDescriptor::FilterPath(std::string_view filter_name) const {
  for (const auto& field : filters) {
    if (field.name == filter_name) return field.path;
  }
  return std::nullopt;
}

void ResourceTypeRegistry::Register(ResourceTypeDescriptor descriptor) {
  for (const auto& existing : descriptors_) {
    if (existing.type == descriptor.type || existing.name == descriptor.name) {
      throw std::logic_error("resource type registered twice: " + descriptor.name);
    }
    if (existing.id_prefix == descriptor.id_prefix) {
      throw std::logic_error("id prefix '" + descriptor.id_prefix + "' shared by " + existing.name + " and " + descriptor.name);
    }
  }
  descriptors_.push_back(std::move(descriptor));
}

const ResourceTypeDescriptor& ResourceTypeRegistry::Get(ResourceType type) const {
  for (const auto& descriptor : descriptors_) {
    if (descriptor.type == type) return descriptor;
  }
  throw std::out_of_range("resource type not registered: " + std::string(ToString(type)));
}

const ResourceTypeDescriptor* ResourceTypeRegistry::FindByName(std::string_view name) const {
  for (const auto& descriptor : descriptors_) {
    if (descriptor.name == name) return &descriptor;
  }
  return nullptr;
}

const ResourceTypeDescriptor* ResourceTypeRegistry::FindByIdPrefix(std::string_view id) const {
  const auto dash = id.rfind('-');
  if (dash == std::string_view::npos) return nullptr;
  const auto prefix = id.substr(0, dash);
  for (const auto& descriptor : descriptors_) {
    if (descriptor.id_prefix == prefix) return &descriptor;
  }
  return nullptr;
}

void ResourceTypeRegistry::UseShortIds(const std::vector<std::string>& type_names) {
  for (const auto& name : type_names) {
    auto it = std::find_if(descriptors_.begin(), descriptors_.end(), [&](const auto& d) { return d.name == name; });
    if (it == descriptors_.end()) {
      throw std::invalid_argument("unknown resource type in short_id_types: " + name);
    }
    it->id_style = IdStyle::kShort;
  }
}

std::string_view ToString(ResourceType type) {
  switch (type) {
    case ResourceType::kVpc:
      return "vpc";
    case ResourceType::kSubnet:
      return "subnet";
    case ResourceType::kSecurityGroup:
      return "security-group";
    case ResourceType::kRouteTable:
      return "route-table";
    case ResourceType::kNetworkAcl:
      return "network-acl";
    case ResourceType::kInternetGateway:
      return "internet-gateway";
    case ResourceType::kInstance:
      return "instance";
    case ResourceType::kVolume:
      return "volume";
    case ResourceType::kSnapshot:
      return "snapshot";
    case ResourceType::kKeyPair:
      return "key-pair";
    case ResourceType::kElasticIp:
      return "elastic-ip";
  }
  return "unknown";
}

// ------------------------------------------------------------
// Built-in declarations
// ------------------------------------------------------------

ResourceTypeRegistry ResourceTypeRegistry::BuiltIn() {
  ResourceTypeRegistry registry;

  registry.Register({
      .type           = ResourceType::kVpc,
      .name           = "vpc",
      .id_prefix      = "vpc",
      .id_attribute   = "VpcId",
      .not_found_code = "InvalidVpcID.NotFound",
      .initial_state  = "available",
      .states         = {"pending", "available"},
      .cascades =
          {
              {ResourceType::kSecurityGroup, "GroupName", "default"},
              {ResourceType::kRouteTable, "Associations.Main", "true"},
              {ResourceType::kNetworkAcl, "IsDefault", "true"},
          },
      .filters =
          {
              {"vpc-id", "@id"},
              {"state", "@state"},
              {"cidr", "CidrBlock"},
              {"cidr-block", "CidrBlock"},
              {"cidr-block-association.cidr-block", "CidrBlockAssociationSet.CidrBlock"},
              {"cidr-block-association.association-id", "CidrBlockAssociationSet.AssociationId"},
              {"cidr-block-association.state", "CidrBlockAssociationSet.CidrBlockState.State"},
              {"dhcp-options-id", "DhcpOptionsId"},
              {"instance-tenancy", "InstanceTenancy"},
              {"is-default", "IsDefault"},
              {"isDefault", "IsDefault"},
              {"owner-id", "OwnerId"},
          },
  });

  registry.Register({
      .type           = ResourceType::kSubnet,
      .name           = "subnet",
      .id_prefix      = "subnet",
      .id_attribute   = "SubnetId",
      .not_found_code = "InvalidSubnetID.NotFound",
      .initial_state  = "available",
      .states         = {"pending", "available"},
      .references     = {{"VpcId", ResourceType::kVpc}},
      .filters =
          {
              {"subnet-id", "@id"},
              {"state", "@state"},
              {"vpc-id", "VpcId"},
              {"cidr", "CidrBlock"},
              {"cidr-block", "CidrBlock"},
              {"cidrBlock", "CidrBlock"},
              {"availability-zone", "AvailabilityZone"},
              {"availabilityZone", "AvailabilityZone"},
              {"availability-zone-id", "AvailabilityZoneId"},
              {"available-ip-address-count", "AvailableIpAddressCount"},
              {"default-for-az", "DefaultForAz"},
              {"defaultForAz", "DefaultForAz"},
              {"map-public-ip-on-launch", "MapPublicIpOnLaunch"},
              {"owner-id", "OwnerId"},
              {"subnet-arn", "SubnetArn"},
          },
  });

  registry.Register({
      .type           = ResourceType::kSecurityGroup,
      .name           = "security-group",
      .id_prefix      = "sg",
      .id_attribute   = "GroupId",
      .not_found_code = "InvalidGroup.NotFound",
      .references     = {{"VpcId", ResourceType::kVpc}},
      .filters =
          {
              {"group-id", "@id"},
              {"group-name", "GroupName"},
              {"description", "Description"},
              {"vpc-id", "VpcId"},
              {"owner-id", "OwnerId"},
              {"ip-permission.protocol", "IpPermissions.IpProtocol"},
              {"ip-permission.from-port", "IpPermissions.FromPort"},
              {"ip-permission.to-port", "IpPermissions.ToPort"},
              {"ip-permission.cidr", "IpPermissions.IpRanges.CidrIp"},
              {"egress.ip-permission.protocol", "IpPermissionsEgress.IpProtocol"},
              {"egress.ip-permission.from-port", "IpPermissionsEgress.FromPort"},
              {"egress.ip-permission.to-port", "IpPermissionsEgress.ToPort"},
              {"egress.ip-permission.cidr", "IpPermissionsEgress.IpRanges.CidrIp"},
          },
  });

  registry.Register({
      .type           = ResourceType::kRouteTable,
      .name           = "route-table",
      .id_prefix      = "rtb",
      .id_attribute   = "RouteTableId",
      .not_found_code = "InvalidRouteTableID.NotFound",
      .references     = {{"VpcId", ResourceType::kVpc}},
      .filters =
          {
              {"route-table-id", "@id"},
              {"vpc-id", "VpcId"},
              {"owner-id", "OwnerId"},
              {"association.main", "Associations.Main"},
              {"association.route-table-association-id", "Associations.RouteTableAssociationId"},
              {"association.route-table-id", "Associations.RouteTableId"},
              {"association.subnet-id", "Associations.SubnetId"},
              {"route.destination-cidr-block", "Routes.DestinationCidrBlock"},
              {"route.gateway-id", "Routes.GatewayId"},
              {"route.origin", "Routes.Origin"},
              {"route.state", "Routes.State"},
          },
  });

  registry.Register({
      .type           = ResourceType::kNetworkAcl,
      .name           = "network-acl",
      .id_prefix      = "acl",
      .id_attribute   = "NetworkAclId",
      .not_found_code = "InvalidNetworkAclID.NotFound",
      .references     = {{"VpcId", ResourceType::kVpc}},
      .filters =
          {
              {"network-acl-id", "@id"},
              {"vpc-id", "VpcId"},
              {"default", "IsDefault"},
              {"owner-id", "OwnerId"},
              {"entry.cidr", "Entries.CidrBlock"},
              {"entry.egress", "Entries.Egress"},
              {"entry.protocol", "Entries.Protocol"},
              {"entry.rule-action", "Entries.RuleAction"},
              {"entry.rule-number", "Entries.RuleNumber"},
          },
  });

  registry.Register({
      .type           = ResourceType::kInternetGateway,
      .name           = "internet-gateway",
      .id_prefix      = "igw",
      .id_attribute   = "InternetGatewayId",
      .not_found_code = "InvalidInternetGatewayID.NotFound",
      .references     = {{"Attachments.VpcId", ResourceType::kVpc}},
      .filters =
          {
              {"internet-gateway-id", "@id"},
              {"owner-id", "OwnerId"},
              {"attachment.vpc-id", "Attachments.VpcId"},
              {"attachment.state", "Attachments.State"},
          },
  });

  registry.Register({
      .type            = ResourceType::kInstance,
      .name            = "instance",
      .id_prefix       = "i",
      .id_attribute    = "InstanceId",
      .not_found_code  = "InvalidInstanceID.NotFound",
      .initial_state   = "pending",
      .states          = {"pending", "running", "shutting-down", "terminated", "stopping", "stopped"},
      .terminal_states = {"terminated"},
      .references =
          {
              {"SubnetId", ResourceType::kSubnet},
              {"VpcId", ResourceType::kVpc},
              {"SecurityGroups.GroupId", ResourceType::kSecurityGroup},
          },
      .filters =
          {
              {"instance-id", "@id"},
              {"instance-state-name", "@state"},
              {"instance-state-code", "State.Code"},
              {"instance-type", "InstanceType"},
              {"image-id", "ImageId"},
              {"availability-zone", "Placement.AvailabilityZone"},
              {"tenancy", "Placement.Tenancy"},
              {"subnet-id", "SubnetId"},
              {"vpc-id", "VpcId"},
              {"key-name", "KeyName"},
              {"private-ip-address", "PrivateIpAddress"},
              {"private-dns-name", "PrivateDnsName"},
              {"ip-address", "PublicIpAddress"},
              {"dns-name", "PublicDnsName"},
              {"reservation-id", "ReservationId"},
              {"owner-id", "OwnerId"},
              {"group-id", "SecurityGroups.GroupId"},
              {"group-name", "SecurityGroups.GroupName"},
              {"instance.group-id", "SecurityGroups.GroupId"},
              {"instance.group-name", "SecurityGroups.GroupName"},
              {"architecture", "Architecture"},
              {"launch-time", "LaunchTime"},
              {"root-device-type", "RootDeviceType"},
          },
  });

  registry.Register({
      .type           = ResourceType::kVolume,
      .name           = "volume",
      .id_prefix      = "vol",
      .id_attribute   = "VolumeId",
      .not_found_code = "InvalidVolume.NotFound",
      .initial_state  = "available",
      .states         = {"creating", "available", "in-use", "deleting", "deleted", "error"},
      .references     = {{"Attachments.InstanceId", ResourceType::kInstance}},
      .filters =
          {
              {"volume-id", "@id"},
              {"status", "@state"},
              {"availability-zone", "AvailabilityZone"},
              {"size", "Size"},
              {"volume-type", "VolumeType"},
              {"encrypted", "Encrypted"},
              {"snapshot-id", "SnapshotId"},
              {"create-time", "CreateTime"},
              {"multi-attach-enabled", "MultiAttachEnabled"},
              {"attachment.instance-id", "Attachments.InstanceId"},
              {"attachment.device", "Attachments.Device"},
              {"attachment.status", "Attachments.State"},
              {"attachment.attach-time", "Attachments.AttachTime"},
              {"attachment.delete-on-termination", "Attachments.DeleteOnTermination"},
          },
  });

  // VolumeId on a snapshot is informational: volumes may be deleted while
  // snapshots of them exist.
  registry.Register({
      .type           = ResourceType::kSnapshot,
      .name           = "snapshot",
      .id_prefix      = "snap",
      .id_attribute   = "SnapshotId",
      .not_found_code = "InvalidSnapshot.NotFound",
      .initial_state  = "completed",
      .states         = {"pending", "completed", "error"},
      .filters =
          {
              {"snapshot-id", "@id"},
              {"status", "@state"},
              {"volume-id", "VolumeId"},
              {"volume-size", "VolumeSize"},
              {"owner-id", "OwnerId"},
              {"description", "Description"},
              {"encrypted", "Encrypted"},
              {"progress", "Progress"},
              {"start-time", "StartTime"},
              {"storage-tier", "StorageTier"},
          },
  });

  registry.Register({
      .type           = ResourceType::kKeyPair,
      .name           = "key-pair",
      .id_prefix      = "key",
      .id_attribute   = "KeyPairId",
      .not_found_code = "InvalidKeyPair.NotFound",
      .filters =
          {
              {"key-pair-id", "@id"},
              {"key-name", "KeyName"},
              {"fingerprint", "KeyFingerprint"},
              {"key-type", "KeyType"},
          },
  });

  registry.Register({
      .type           = ResourceType::kElasticIp,
      .name           = "elastic-ip",
      .id_prefix      = "eipalloc",
      .id_attribute   = "AllocationId",
      .not_found_code = "InvalidAllocationID.NotFound",
      .references     = {{"InstanceId", ResourceType::kInstance}},
      .filters =
          {
              {"allocation-id", "@id"},
              {"public-ip", "PublicIp"},
              {"domain", "Domain"},
              {"instance-id", "InstanceId"},
              {"association-id", "AssociationId"},
              {"private-ip-address", "PrivateIpAddress"},
              {"network-border-group", "NetworkBorderGroup"},
              {"public-ipv4-pool", "PublicIpv4Pool"},
          },
  });

  return registry;
}

} // namespace vera::model
