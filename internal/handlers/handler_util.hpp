#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/filter/filter_evaluator.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/value.hpp"
#include "internal/store/resource_store.hpp"

namespace vera::handlers {

// ------------------------------------------------------------
// Parameter readers
// ------------------------------------------------------------

// Missing or empty -> MalformedParameter("MissingParameter").
std::string RequireString(const model::Value& params, std::string_view name);

std::string OptionalString(const model::Value& params, std::string_view name, std::string_view fallback = {});

// Non-integer text -> MalformedParameter("InvalidParameterValue").
std::optional<std::int64_t> OptionalInt(const model::Value& params, std::string_view name);

bool OptionalBool(const model::Value& params, std::string_view name, bool fallback);

// Scalar or sequence of scalars at `name`; absent -> empty.
std::vector<std::string> StringList(const model::Value& params, std::string_view name);

// ------------------------------------------------------------
// Tags
// ------------------------------------------------------------

// Sequence of {Key, Value}. A tag without Key is MissingParameter.
std::vector<model::Tag> ParseTags(const model::Value& tags);

// Tags from TagSpecification entries whose ResourceType is `resource_type`.
std::vector<model::Tag> TagsFor(const model::Value& params, std::string_view resource_type);

model::Value RenderTags(const std::vector<model::Tag>& tags);

// ------------------------------------------------------------
// Responses
// ------------------------------------------------------------

// Attributes plus State (for stateful types that do not carry their own) and
// Tags (only when tagged), in the provider's member names.
model::Value Render(const model::Resource& resource);

model::Value ReturnTrue();

// ------------------------------------------------------------
// Placement
// ------------------------------------------------------------

// Zones the emulator offers in a region: "<region>a" .. "<region>c".
std::vector<std::string> AvailabilityZones(std::string_view region);

bool IsAvailabilityZone(std::string_view region, std::string_view zone);

// "use1-az1" style id of a zone name.
std::string AvailabilityZoneId(std::string_view zone);

// The region's default VPC, if one was created.
std::optional<model::Resource> FindDefaultVpc(const store::ResourceStore& store);
const model::Resource*         FindDefaultVpc(const store::StoreView& view);

// Random address in 54.0.0.0/8, the range handed out for public addresses.
std::string RandomPublicIp();

/*
  Shared body of Describe* actions: every explicitly requested id must exist
  (NotFound with the type otherwise), then Filter is applied in store order
  or request order when ids were given.
*/
std::vector<model::Resource> DescribeResources(const store::ResourceStore& store, const filter::FilterEvaluator& filters, model::ResourceType type,
                                               const std::vector<std::string>& ids, const model::Value& params);

} // namespace vera::handlers
