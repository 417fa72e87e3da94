#include "internal/filter/filter_evaluator.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace vera::filter {

namespace {

constexpr std::string_view kTagPrefix = "tag:";

void AppendValues(const model::Value& node, std::vector<std::string>& out) {
  if (node.IsList()) {
    for (std::size_t i = 0; i < node.size(); ++i) {
      AppendValues(node.at(i), out);
    }
    return;
  }
  if (!node.IsScalar()) {
    throw util::MalformedParameter("filter values must be strings");
  }
  out.push_back(node.ToText());
}

} // namespace

FilterEvaluator::FilterEvaluator(std::shared_ptr<const model::ResourceTypeRegistry> registry) : registry_(std::move(registry)) {
}

bool FilterEvaluator::Evaluate(const model::Resource& resource, const std::vector<FilterSpec>& filters) const {
  for (const auto& filter : filters) {
    if (!Matches(resource, filter)) return false;
  }
  return true;
}

std::vector<model::Resource> FilterEvaluator::EvaluateAll(std::vector<model::Resource> resources, const std::vector<FilterSpec>& filters) const {
  if (filters.empty()) return resources;

  resources.erase(std::remove_if(resources.begin(), resources.end(), [&](const model::Resource& r) { return !Evaluate(r, filters); }),
                  resources.end());
  return resources;
}

bool FilterEvaluator::Matches(const model::Resource& resource, const FilterSpec& filter) const {
  if (filter.values.empty()) return false;

  const auto candidates = Candidates(resource, filter.name);
  for (const auto& candidate : candidates) {
    for (const auto& pattern : filter.values) {
      if (MatchValue(pattern, candidate)) return true;
    }
  }
  return false;
}

std::vector<std::string> FilterEvaluator::Candidates(const model::Resource& resource, std::string_view name) const {
  std::vector<std::string> out;

  if (name.starts_with(kTagPrefix)) {
    if (const auto* tag = resource.FindTag(name.substr(kTagPrefix.size()))) out.push_back(tag->value);
    return out;
  }
  if (name == "tag-key" || name == "tag-value") {
    for (const auto& tag : resource.tags) {
      out.push_back(name == "tag-key" ? tag.key : tag.value);
    }
    return out;
  }

  const auto path = registry_->Get(resource.type).FilterPath(name);
  if (!path) return out;

  if (*path == "@id") {
    out.push_back(resource.id);
  } else if (*path == "@state") {
    out.push_back(resource.state);
  } else {
    model::CollectScalars(resource.attributes, *path, out);
  }
  return out;
}

bool GlobMatch(std::string_view pattern, std::string_view text) {
  std::size_t p = 0;
  std::size_t t = 0;
  // Position after the most recent '*' and the text offset it was tried at.
  std::size_t star       = std::string_view::npos;
  std::size_t star_match = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star       = ++p;
      star_match = t;
    } else if (star != std::string_view::npos) {
      p = star;
      t = ++star_match;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

bool MatchValue(std::string_view pattern, std::string_view text) {
  if (pattern.find_first_of("*?") == std::string_view::npos) return pattern == text;
  return GlobMatch(pattern, text);
}

std::vector<FilterSpec> ParseFilters(const model::Value& params) {
  std::vector<FilterSpec> filters;

  const auto* raw = params.Find("Filter");
  if (!raw) raw = params.Find("Filters");
  if (!raw || raw->IsNull()) return filters;
  if (!raw->IsList()) {
    throw util::MalformedParameter("Filter must be a list of Name/Value pairs");
  }

  for (std::size_t i = 0; i < raw->size(); ++i) {
    const auto& entry = raw->at(i);
    const auto* name  = entry.Find("Name");
    if (!name || !name->IsScalar() || name->ToText().empty()) {
      throw util::MalformedParameter("Filter." + std::to_string(i + 1) + ".Name is required", "MissingParameter");
    }

    FilterSpec spec;
    spec.name = name->ToText();
    const auto* values = entry.Find("Value");
    if (!values) values = entry.Find("Values");
    if (values) AppendValues(*values, spec.values);
    filters.push_back(std::move(spec));
  }
  return filters;
}

} // namespace vera::filter
