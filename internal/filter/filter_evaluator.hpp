#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/resource.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/model/value.hpp"

namespace vera::filter {

// One "describe" constraint: provider filter name plus accepted values.
struct FilterSpec {
  std::string              name;
  std::vector<std::string> values;
};

/*
  FilterEvaluator

  Stateless apart from the registry it reads filter tables from.

  - AND across filters, OR across the values of one filter
  - tag:<Key>, tag-key and tag-value resolve against the tag set
  - other names go through the resource type's filter table; names the table
    does not declare match nothing
  - a list-valued attribute matches if any element matches
*/
class FilterEvaluator {
 public:
  explicit FilterEvaluator(std::shared_ptr<const model::ResourceTypeRegistry> registry);

  bool Evaluate(const model::Resource& resource, const std::vector<FilterSpec>& filters) const;

  std::vector<model::Resource> EvaluateAll(std::vector<model::Resource> resources, const std::vector<FilterSpec>& filters) const;

 private:
  bool                     Matches(const model::Resource& resource, const FilterSpec& filter) const;
  std::vector<std::string> Candidates(const model::Resource& resource, std::string_view name) const;

  std::shared_ptr<const model::ResourceTypeRegistry> registry_;
};

// '*' matches any run of characters, '?' exactly one.
bool GlobMatch(std::string_view pattern, std::string_view text);

// Glob when the pattern carries a wildcard, plain equality otherwise.
bool MatchValue(std::string_view pattern, std::string_view text);

// Reads the decoded "Filter" parameter: a sequence of {Name, Value: [...]}.
// A missing parameter yields no filters.
std::vector<FilterSpec> ParseFilters(const model::Value& params);

} // namespace vera::filter
