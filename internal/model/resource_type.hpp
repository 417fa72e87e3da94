#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vera::model {

enum class ResourceType {
  kVpc,
  kSubnet,
  kSecurityGroup,
  kRouteTable,
  kNetworkAcl,
  kInternetGateway,
  kInstance,
  kVolume,
  kSnapshot,
  kKeyPair,
  kElasticIp,
};

enum class IdStyle {
  kShort, // 8 hex digits, legacy form
  kLong,  // 17 hex digits
};

std::size_t SuffixLength(IdStyle style);

// Attribute path holding the id of another managed resource.
struct ReferenceField {
  std::string  path;
  ResourceType target;
};

/*
  Cascade rule: a referencing resource of `type` whose attribute at `path`
  renders as `equals` is removed together with the referenced resource
  instead of blocking its deletion. An empty path matches every resource of
  that type.
*/
struct CascadeRule {
  ResourceType type;
  std::string  path;
  std::string  equals;
};

// Provider filter name -> attribute path. "@id" and "@state" address the
// resource id and lifecycle state.
struct FilterField {
  std::string name;
  std::string path;
};

struct ResourceTypeDescriptor {
  ResourceType                type;
  std::string                 name;
  std::string                 id_prefix;
  IdStyle                     id_style = IdStyle::kLong;
  std::string                 id_attribute;
  std::string                 not_found_code;
  std::string                 initial_state;
  std::vector<std::string>    states;
  std::vector<std::string>    terminal_states;
  std::vector<ReferenceField> references;
  std::vector<CascadeRule>    cascades;
  std::vector<FilterField>    filters;

  bool IsValidState(std::string_view state) const;
  bool IsTerminalState(std::string_view state) const;
  // Empty when the name is not a declared filter.
  std::optional<std::string> FilterPath(std::string_view filter_name) const;
};

/*
  ResourceTypeRegistry

  Immutable table of per-type declarations. Built once in the composition
  root and shared by reference with the store, the filter evaluator and the
  gateway.
*/
class ResourceTypeRegistry {
 public:
  ResourceTypeRegistry() = default;

  // The declarations of the emulated compute/networking service.
  static ResourceTypeRegistry BuiltIn();

  void Register(ResourceTypeDescriptor descriptor);

  const ResourceTypeDescriptor&                Get(ResourceType type) const;
  const ResourceTypeDescriptor*                FindByName(std::string_view name) const;
  // Resolves a type from an id's prefix ("vpc-0a1b..." -> vpc).
  const ResourceTypeDescriptor*                FindByIdPrefix(std::string_view id) const;
  const std::vector<ResourceTypeDescriptor>&   All() const {
    return descriptors_;
  }

  // Switches the named types to the short legacy id form.
  void UseShortIds(const std::vector<std::string>& type_names);

 private:
  std::vector<ResourceTypeDescriptor> descriptors_;
};

std::string_view ToString(ResourceType type);

} // namespace vera::model
