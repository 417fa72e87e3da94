#include "internal/handlers/handler_util.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace vera::handlers {

std::string RequireString(const model::Value& params, std::string_view name) {
  const auto* value = params.Find(name);
  if (!value || !value->IsScalar() || value->ToText().empty()) {
    throw util::MalformedParameter("The request must contain the parameter " + std::string(name), "MissingParameter");
  }
  return value->ToText();
}

std::string OptionalString(const model::Value& params, std::string_view name, std::string_view fallback) {
  const auto* value = params.Find(name);
  if (!value || !value->IsScalar()) return std::string(fallback);
  return value->ToText();
}

std::optional<std::int64_t> OptionalInt(const model::Value& params, std::string_view name) {
  const auto* value = params.Find(name);
  if (!value || value->IsNull()) return std::nullopt;
  try {
    return value->AsInt();
  } catch (const std::invalid_argument&) {
    throw util::MalformedParameter("Invalid value '" + value->ToText() + "' for " + std::string(name) + ", expected an integer");
  }
}

bool OptionalBool(const model::Value& params, std::string_view name, bool fallback) {
  const auto* value = params.Find(name);
  if (!value || !value->IsScalar()) return fallback;
  if (value->kind() == model::Value::Kind::kBool) return value->AsBool();

  const auto text = value->ToText();
  if (text == "true") return true;
  if (text == "false") return false;
  throw util::MalformedParameter("Invalid value '" + text + "' for " + std::string(name) + ", expected true or false");
}

std::vector<std::string> StringList(const model::Value& params, std::string_view name) {
  std::vector<std::string> out;
  const auto*              value = params.Find(name);
  if (!value || value->IsNull()) return out;

  if (value->IsScalar()) {
    out.push_back(value->ToText());
    return out;
  }
  if (!value->IsList()) {
    throw util::MalformedParameter(std::string(name) + " must be a list of strings");
  }
  for (std::size_t i = 0; i < value->size(); ++i) {
    if (!value->at(i).IsScalar()) {
      throw util::MalformedParameter(std::string(name) + " must be a list of strings");
    }
    out.push_back(value->at(i).ToText());
  }
  return out;
}

std::vector<model::Tag> ParseTags(const model::Value& tags) {
  std::vector<model::Tag> out;
  if (tags.IsNull()) return out;
  if (!tags.IsList()) {
    throw util::MalformedParameter("Tag must be a list of Key/Value pairs");
  }
  for (std::size_t i = 0; i < tags.size(); ++i) {
    const auto& entry = tags.at(i);
    const auto  key   = entry.GetString("Key");
    if (key.empty()) {
      throw util::MalformedParameter("Tag." + std::to_string(i + 1) + ".Key is required", "MissingParameter");
    }
    out.push_back({key, entry.GetString("Value")});
  }
  return out;
}

std::vector<model::Tag> TagsFor(const model::Value& params, std::string_view resource_type) {
  std::vector<model::Tag> out;
  const auto*             specs = params.Find("TagSpecification");
  if (!specs) specs = params.Find("TagSpecifications");
  if (!specs || !specs->IsList()) return out;

  for (std::size_t i = 0; i < specs->size(); ++i) {
    const auto& spec = specs->at(i);
    if (spec.GetString("ResourceType") != resource_type) continue;

    const auto* tags = spec.Find("Tag");
    if (!tags) tags = spec.Find("Tags");
    if (!tags) continue;
    model::MergeTags(out, ParseTags(*tags));
  }
  return out;
}

model::Value RenderTags(const std::vector<model::Tag>& tags) {
  auto list = model::Value::List();
  for (const auto& tag : tags) {
    list.Append(model::Value::Map({{"Key", tag.key}, {"Value", tag.value}}));
  }
  return list;
}

model::Value Render(const model::Resource& resource) {
  auto body = resource.attributes;
  if (!resource.state.empty() && !body.Contains("State")) {
    body.Set("State", resource.state);
  }
  if (!resource.tags.empty()) {
    body.Set("Tags", RenderTags(resource.tags));
  }
  return body;
}

model::Value ReturnTrue() {
  return model::Value::Map({{"Return", true}});
}

std::vector<std::string> AvailabilityZones(std::string_view region) {
  std::vector<std::string> zones;
  for (char suffix : {'a', 'b', 'c'}) {
    zones.push_back(std::string(region) + suffix);
  }
  return zones;
}

bool IsAvailabilityZone(std::string_view region, std::string_view zone) {
  const auto zones = AvailabilityZones(region);
  return std::find(zones.begin(), zones.end(), zone) != zones.end();
}

std::string AvailabilityZoneId(std::string_view zone) {
  if (zone.empty()) return {};

  // us-east-1a -> use1-az1
  std::string id;
  std::size_t start = 0;
  const auto  body  = zone.substr(0, zone.size() - 1);
  while (start < body.size()) {
    auto dash = body.find('-', start);
    auto part = body.substr(start, dash == std::string_view::npos ? std::string_view::npos : dash - start);
    if (!part.empty()) {
      if (start == 0 || std::isdigit(static_cast<unsigned char>(part.front()))) {
        id += part;
      } else {
        id += part.front();
      }
    }
    if (dash == std::string_view::npos) break;
    start = dash + 1;
  }
  const int index = zone.back() - 'a' + 1;
  return id + "-az" + std::to_string(index);
}

namespace {

bool IsDefaultVpc(const model::Resource& vpc) {
  const auto* is_default = vpc.attributes.Find("IsDefault");
  return is_default && is_default->kind() == model::Value::Kind::kBool && is_default->AsBool();
}

} // namespace

std::optional<model::Resource> FindDefaultVpc(const store::ResourceStore& store) {
  for (auto& vpc : store.List(model::ResourceType::kVpc)) {
    if (IsDefaultVpc(vpc)) return std::move(vpc);
  }
  return std::nullopt;
}

const model::Resource* FindDefaultVpc(const store::StoreView& view) {
  for (const auto* vpc : view.List(model::ResourceType::kVpc)) {
    if (IsDefaultVpc(*vpc)) return vpc;
  }
  return nullptr;
}

std::string RandomPublicIp() {
  const auto  hex = util::RandomHex(6);
  std::string ip  = "54";
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    ip += "." + std::to_string(std::stoi(hex.substr(i, 2), nullptr, 16));
  }
  return ip;
}

std::vector<model::Resource> DescribeResources(const store::ResourceStore& store, const filter::FilterEvaluator& filters, model::ResourceType type,
                                               const std::vector<std::string>& ids, const model::Value& params) {
  std::vector<model::Resource> resources;
  if (ids.empty()) {
    resources = store.List(type);
  } else {
    resources.reserve(ids.size());
    for (const auto& id : ids) {
      const bool seen = std::any_of(resources.begin(), resources.end(), [&](const model::Resource& r) { return r.id == id; });
      if (!seen) resources.push_back(store.Get(type, id));
    }
  }
  return filters.EvaluateAll(std::move(resources), filter::ParseFilters(params));
}

} // namespace vera::handlers
