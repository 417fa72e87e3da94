#include "internal/handlers/tag_handler.hpp"

#include <algorithm>

#include "internal/handlers/handler_util.hpp"
#include "internal/util/errors.hpp"

namespace vera::handlers {

using model::ResourceType;
using model::Value;

namespace {

std::vector<std::string> RequireResourceIds(const store::ResourceStore& store, const Value& params) {
  auto ids = StringList(params, "ResourceId");
  if (ids.empty()) {
    throw util::MalformedParameter("The request must contain the parameter resourceIdSet", "MissingParameter");
  }
  // All ids are checked before any tag changes.
  for (const auto& id : ids) {
    if (!store.Lookup(id)) {
      const auto* descriptor = store.registry().FindByIdPrefix(id);
      const auto  type       = descriptor ? std::optional<ResourceType>(descriptor->type) : std::nullopt;
      const auto  name       = descriptor ? descriptor->name : std::string("resource");
      throw util::NotFound(type, id, "The " + name + " ID '" + id + "' does not exist");
    }
  }
  return ids;
}

struct TagRow {
  std::string resource_id;
  std::string resource_type;
  std::string key;
  std::string value;

  const std::string* Field(std::string_view filter) const {
    if (filter == "key") return &key;
    if (filter == "value") return &value;
    if (filter == "resource-id") return &resource_id;
    if (filter == "resource-type") return &resource_type;
    return nullptr;
  }
};

bool Matches(const TagRow& row, const std::vector<filter::FilterSpec>& specs) {
  return std::all_of(specs.begin(), specs.end(), [&](const filter::FilterSpec& spec) {
    const auto* field = row.Field(spec.name);
    return field && std::any_of(spec.values.begin(), spec.values.end(), [&](const std::string& pattern) { return filter::MatchValue(pattern, *field); });
  });
}

} // namespace

TagHandler::TagHandler(HandlerDeps deps) : HandlerBase(std::move(deps)) {
  On("CreateTags", [this](const Value& p, const gateway::RequestContext& c) { return CreateTags(p, c); });
  On("DeleteTags", [this](const Value& p, const gateway::RequestContext& c) { return DeleteTags(p, c); });
  On("DescribeTags", [this](const Value& p, const gateway::RequestContext& c) { return DescribeTags(p, c); });
}

Value TagHandler::CreateTags(const Value& params, const gateway::RequestContext&) {
  const auto ids = RequireResourceIds(store(), params);

  const auto* tag_param = params.Find("Tag");
  const auto  tags      = tag_param ? ParseTags(*tag_param) : std::vector<model::Tag>{};
  if (tags.empty()) {
    throw util::MalformedParameter("The request must contain the parameter tagSet", "MissingParameter");
  }
  for (const auto& id : ids) {
    store().TagResource(id, tags);
  }
  return ReturnTrue();
}

// Without Tag every tag is removed; a Tag with a Value only removes a match.
Value TagHandler::DeleteTags(const Value& params, const gateway::RequestContext&) {
  const auto ids = RequireResourceIds(store(), params);

  std::vector<store::TagSelector> selectors;
  const auto*                     tag_param = params.Find("Tag");
  if (tag_param && !tag_param->IsList()) {
    throw util::MalformedParameter("Tag must be a list of Key/Value pairs");
  }
  if (tag_param) {
    for (std::size_t i = 0; i < tag_param->size(); ++i) {
      const auto& entry = tag_param->at(i);
      const auto  key   = entry.GetString("Key");
      if (key.empty()) {
        throw util::MalformedParameter("Tag." + std::to_string(i + 1) + ".Key is required", "MissingParameter");
      }
      store::TagSelector selector{key, std::nullopt};
      if (const auto* value = entry.Find("Value")) selector.value = value->ToText();
      selectors.push_back(std::move(selector));
    }
  }

  for (const auto& id : ids) {
    if (!tag_param) {
      const auto resource = store().Lookup(id);
      std::vector<std::string> keys;
      for (const auto& tag : resource ? resource->tags : std::vector<model::Tag>{}) {
        keys.push_back(tag.key);
      }
      store().UntagResource(id, keys);
    } else {
      store().UntagResource(id, selectors);
    }
  }
  return ReturnTrue();
}

Value TagHandler::DescribeTags(const Value& params, const gateway::RequestContext&) {
  const auto specs = filter::ParseFilters(params);

  auto list = Value::List();
  for (const auto& descriptor : store().registry().All()) {
    for (const auto& resource : store().List(descriptor.type)) {
      for (const auto& tag : resource.tags) {
        const TagRow row{resource.id, descriptor.name, tag.key, tag.value};
        if (!Matches(row, specs)) continue;
        list.Append(Value::Map({
            {"ResourceId", row.resource_id},
            {"ResourceType", row.resource_type},
            {"Key", row.key},
            {"Value", row.value},
        }));
      }
    }
  }
  return Value::Map({{"Tags", std::move(list)}});
}

} // namespace vera::handlers
