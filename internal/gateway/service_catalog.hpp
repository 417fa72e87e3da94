#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/protocol/query_decoder.hpp"

namespace vera::gateway {

enum class Protocol {
  kEc2,   // flat query parameters, XML response with <item> lists
  kQuery, // flat query parameters with ".member." lists, <Result> wrapper
  kJson,  // JSON body addressed by X-Amz-Target
};

std::string_view ToString(Protocol protocol);

/*
  Everything the gateway needs to speak one emulated service: how requests
  are decoded, how responses are shaped and which actions must have a
  handler before the process may start.
*/
struct ServiceDefinition {
  std::string name;
  Protocol    protocol = Protocol::kEc2;
  std::string api_version;
  std::string xml_namespace;
  // JSON protocol only: the part of X-Amz-Target before the action name.
  std::string target_prefix;

  std::vector<std::string> actions;

  // Member -> element name overrides for XML protocols ("Vpcs" -> "vpcSet",
  // scoped form "Instances.State" -> "instanceState").
  std::unordered_map<std::string, std::string> element_names;

  protocol::DecodeOptions decode;
};

class ServiceCatalog {
 public:
  // Throws std::logic_error on a duplicate name or target prefix.
  void Register(ServiceDefinition definition);

  const ServiceDefinition*              Find(std::string_view name) const;
  const ServiceDefinition*              FindByTargetPrefix(std::string_view prefix) const;
  const std::vector<ServiceDefinition>& All() const {
    return services_;
  }

  // Lets the named services accept gaps in flat list positions.
  void AllowSparseLists(const std::vector<std::string>& service_names);

 private:
  std::vector<ServiceDefinition> services_;
};

// ec2 (compute/networking) and sts (caller identity).
ServiceCatalog DefaultServiceCatalog();

} // namespace vera::gateway
