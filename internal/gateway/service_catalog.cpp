#include "internal/gateway/service_catalog.hpp"

#include <algorithm>
#include <stdexcept>

namespace vera::gateway {

namespace {

ServiceDefinition Ec2Service() {
  ServiceDefinition ec2;
  ec2.name          = "ec2";
  ec2.protocol      = Protocol::kEc2;
  ec2.api_version   = "2016-11-15";
  ec2.xml_namespace = "http://ec2.amazonaws.com/doc/2016-11-15/";
  ec2.actions       = {
      "CreateVpc",
      "CreateDefaultVpc",
      "DescribeVpcs",
      "DeleteVpc",
      "ModifyVpcAttribute",
      "DescribeVpcAttribute",
      "CreateSubnet",
      "DescribeSubnets",
      "DeleteSubnet",
      "CreateSecurityGroup",
      "DescribeSecurityGroups",
      "DeleteSecurityGroup",
      "AuthorizeSecurityGroupIngress",
      "AuthorizeSecurityGroupEgress",
      "RevokeSecurityGroupIngress",
      "RevokeSecurityGroupEgress",
      "CreateRouteTable",
      "DescribeRouteTables",
      "DeleteRouteTable",
      "CreateRoute",
      "DeleteRoute",
      "DescribeNetworkAcls",
      "CreateInternetGateway",
      "DescribeInternetGateways",
      "DeleteInternetGateway",
      "AttachInternetGateway",
      "DetachInternetGateway",
      "RunInstances",
      "DescribeInstances",
      "TerminateInstances",
      "StopInstances",
      "StartInstances",
      "CreateVolume",
      "DescribeVolumes",
      "DeleteVolume",
      "AttachVolume",
      "DetachVolume",
      "CreateSnapshot",
      "DescribeSnapshots",
      "DeleteSnapshot",
      "CreateKeyPair",
      "ImportKeyPair",
      "DescribeKeyPairs",
      "DeleteKeyPair",
      "AllocateAddress",
      "DescribeAddresses",
      "ReleaseAddress",
      "AssociateAddress",
      "DisassociateAddress",
      "CreateTags",
      "DeleteTags",
      "DescribeTags",
      "DescribeRegions",
      "DescribeAvailabilityZones",
      "DescribeAccountAttributes",
  };

  // Sequences whose element name is not "<lowerCamel>Set", and members the
  // wire protocol renames.
  ec2.element_names = {
      {"Vpcs", "vpcSet"},
      {"Subnets", "subnetSet"},
      {"SecurityGroups", "securityGroupInfo"},
      {"Instances.SecurityGroups", "groupSet"},
      {"Reservations", "reservationSet"},
      {"Groups", "groupSet"},
      {"Instances", "instancesSet"},
      {"StartingInstances", "instancesSet"},
      {"StoppingInstances", "instancesSet"},
      {"TerminatingInstances", "instancesSet"},
      {"IpPermissions", "ipPermissions"},
      {"IpPermissionsEgress", "ipPermissionsEgress"},
      {"IpRanges", "ipRanges"},
      {"Ipv6Ranges", "ipv6Ranges"},
      {"UserIdGroupPairs", "groups"},
      {"PrefixListIds", "prefixListIds"},
      {"Volumes", "volumeSet"},
      {"Attachments", "attachmentSet"},
      {"InternetGateways.Attachments", "attachmentSet"},
      {"KeyPairs", "keySet"},
      {"Addresses", "addressesSet"},
      {"RouteTables", "routeTableSet"},
      {"Associations", "associationSet"},
      {"Routes", "routeSet"},
      {"PropagatingVgws", "propagatingVgwSet"},
      {"NetworkAcls", "networkAclSet"},
      {"Entries", "entrySet"},
      {"InternetGateways", "internetGatewaySet"},
      {"Snapshots", "snapshotSet"},
      {"Regions", "regionInfo"},
      {"AvailabilityZones", "availabilityZoneInfo"},
      {"AccountAttributes", "accountAttributeSet"},
      {"AttributeValues", "attributeValueSet"},
      {"Tags", "tagSet"},
      {"CidrBlockAssociationSet", "cidrBlockAssociationSet"},
      {"Ipv6CidrBlockAssociationSet", "ipv6CidrBlockAssociationSet"},
      {"BlockDeviceMappings", "blockDeviceMapping"},
      {"Instances.State", "instanceState"},
      {"Instances.PublicIpAddress", "ipAddress"},
      {"Instances.PublicDnsName", "dnsName"},
  };
  return ec2;
}

ServiceDefinition StsService() {
  ServiceDefinition sts;
  sts.name                     = "sts";
  sts.protocol                 = Protocol::kQuery;
  sts.api_version              = "2011-06-15";
  sts.xml_namespace            = "https://sts.amazonaws.com/doc/2011-06-15/";
  sts.actions                  = {"GetCallerIdentity"};
  sts.decode.list_member_token = "member";
  return sts;
}

} // namespace

std::string_view ToString(Protocol protocol) {
  switch (protocol) {
    case Protocol::kEc2:
      return "ec2";
    case Protocol::kQuery:
      return "query";
    case Protocol::kJson:
      return "json";
  }
  return "unknown";
}

void ServiceCatalog::Register(ServiceDefinition definition) {
  for (const auto& existing : services_) {
    if (existing.name == definition.name) {
      throw std::logic_error("service registered twice: " + definition.name);
    }
    if (!definition.target_prefix.empty() && existing.target_prefix == definition.target_prefix) {
      throw std::logic_error("target prefix '" + definition.target_prefix + "' shared by " + existing.name + " and " + definition.name);
    }
  }
  if (definition.protocol == Protocol::kJson && definition.target_prefix.empty()) {
    throw std::logic_error("json service " + definition.name + " needs a target prefix");
  }
  services_.push_back(std::move(definition));
}

const ServiceDefinition* ServiceCatalog::Find(std::string_view name) const {
  auto it = std::find_if(services_.begin(), services_.end(), [&](const auto& s) { return s.name == name; });
  return it == services_.end() ? nullptr : &*it;
}

const ServiceDefinition* ServiceCatalog::FindByTargetPrefix(std::string_view prefix) const {
  if (prefix.empty()) return nullptr;
  auto it = std::find_if(services_.begin(), services_.end(), [&](const auto& s) { return s.target_prefix == prefix; });
  return it == services_.end() ? nullptr : &*it;
}

void ServiceCatalog::AllowSparseLists(const std::vector<std::string>& service_names) {
  for (const auto& name : service_names) {
    auto it = std::find_if(services_.begin(), services_.end(), [&](const auto& s) { return s.name == name; });
    if (it == services_.end()) {
      throw std::invalid_argument("unknown service in allow_sparse_lists: " + name);
    }
    it->decode.allow_sparse_lists = true;
  }
}

ServiceCatalog DefaultServiceCatalog() {
  ServiceCatalog catalog;
  catalog.Register(Ec2Service());
  catalog.Register(StsService());
  return catalog;
}

} // namespace vera::gateway
