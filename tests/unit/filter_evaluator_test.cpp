#include "internal/filter/filter_evaluator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using vera::filter::FilterEvaluator;
using vera::filter::FilterSpec;
using vera::filter::GlobMatch;
using vera::filter::MatchValue;
using vera::filter::ParseFilters;
using vera::model::Resource;
using vera::model::ResourceType;
using vera::model::ResourceTypeRegistry;
using vera::model::Value;

std::shared_ptr<const ResourceTypeRegistry> Registry() {
  return std::make_shared<const ResourceTypeRegistry>(ResourceTypeRegistry::BuiltIn());
}

Resource MakeInstance(const std::string& id, const std::string& type, const std::string& state) {
  Resource resource;
  resource.type  = ResourceType::kInstance;
  resource.id    = id;
  resource.state = state;
  resource.attributes.Set("InstanceId", id);
  resource.attributes.Set("InstanceType", type);

  auto groups = Value::List();
  groups.Append(Value::Map({{"GroupId", "sg-aaa"}, {"GroupName", "default"}}));
  groups.Append(Value::Map({{"GroupId", "sg-bbb"}, {"GroupName", "web"}}));
  resource.attributes.Set("SecurityGroups", groups);
  return resource;
}

void TestGlob() {
  assert(GlobMatch("t2.*", "t2.micro"));
  assert(GlobMatch("*micro", "t2.micro"));
  assert(GlobMatch("t?.micro", "t3.micro"));
  assert(GlobMatch("*", ""));
  assert(GlobMatch("a*b*c", "axxbyyc"));
  assert(!GlobMatch("t2.*", "t3.micro"));
  assert(!GlobMatch("t?.micro", "t23.micro"));

  // Without wildcards the comparison is exact.
  assert(MatchValue("t2.micro", "t2.micro"));
  assert(!MatchValue("t2.micro", "t2.micro2"));
}

void TestAndAcrossOrWithin() {
  FilterEvaluator evaluator(Registry());
  const auto      micro = MakeInstance("i-1", "t2.micro", "running");

  assert(evaluator.Evaluate(micro, {{"instance-type", {"t3.small", "t2.micro"}}}));
  assert(evaluator.Evaluate(micro, {{"instance-type", {"t2.micro"}}, {"instance-state-name", {"running"}}}));
  assert(!evaluator.Evaluate(micro, {{"instance-type", {"t2.micro"}}, {"instance-state-name", {"stopped"}}}));
}

void TestInstanceTypeFilterSelectsExactly() {
  FilterEvaluator evaluator(Registry());

  std::vector<Resource> all = {
      MakeInstance("i-1", "t2.micro", "running"),
      MakeInstance("i-2", "t3.small", "running"),
      MakeInstance("i-3", "t2.micro", "stopped"),
  };

  const auto micro = evaluator.EvaluateAll(all, {{"instance-type", {"t2.micro"}}});
  assert(micro.size() == 2);
  assert(micro[0].id == "i-1");
  assert(micro[1].id == "i-3");

  const auto small = evaluator.EvaluateAll(all, {{"instance-type", {"t3.small"}}});
  assert(small.size() == 1 && small[0].id == "i-2");

  // Every instance falls in exactly one of the two partitions.
  assert(micro.size() + small.size() == all.size());

  assert(evaluator.EvaluateAll(all, {}).size() == 3);
}

void TestListValuedAttributeMatchesAnyElement() {
  FilterEvaluator evaluator(Registry());
  const auto      instance = MakeInstance("i-1", "t2.micro", "running");

  assert(evaluator.Evaluate(instance, {{"group-id", {"sg-bbb"}}}));
  assert(evaluator.Evaluate(instance, {{"group-name", {"we*"}}}));
  assert(!evaluator.Evaluate(instance, {{"group-id", {"sg-ccc"}}}));
}

void TestTagFilters() {
  FilterEvaluator evaluator(Registry());
  auto            instance = MakeInstance("i-1", "t2.micro", "running");
  instance.tags            = {{"Env", "prod"}, {"Team", "core"}};

  assert(evaluator.Evaluate(instance, {{"tag:Env", {"prod"}}}));
  assert(!evaluator.Evaluate(instance, {{"tag:Env", {"dev"}}}));
  assert(!evaluator.Evaluate(instance, {{"tag:Owner", {"*"}}}));
  assert(evaluator.Evaluate(instance, {{"tag-key", {"Team"}}}));
  assert(evaluator.Evaluate(instance, {{"tag-value", {"co*"}}}));
}

void TestUnknownFilterAndEmptyValuesMatchNothing() {
  FilterEvaluator evaluator(Registry());
  const auto      instance = MakeInstance("i-1", "t2.micro", "running");

  assert(!evaluator.Evaluate(instance, {{"no-such-filter", {"*"}}}));
  assert(!evaluator.Evaluate(instance, {FilterSpec{"instance-type", {}}}));
}

void TestParseFilters() {
  auto values = Value::List();
  values.Append("a");
  values.Append("b");

  auto filters = Value::List();
  filters.Append(Value::Map({{"Name", "vpc-id"}, {"Value", values}}));

  auto params = Value::Map();
  params.Set("Filter", filters);

  const auto parsed = ParseFilters(params);
  assert(parsed.size() == 1);
  assert(parsed[0].name == "vpc-id");
  assert(parsed[0].values.size() == 2);
  assert(parsed[0].values[1] == "b");

  assert(ParseFilters(Value::Map()).empty());

  auto nameless = Value::List();
  nameless.Append(Value::Map({{"Value", values}}));
  auto bad = Value::Map();
  bad.Set("Filter", nameless);

  bool threw = false;
  try {
    (void)ParseFilters(bad);
  } catch (const vera::util::MalformedParameter& e) {
    threw = e.code() == "MissingParameter";
  }
  assert(threw);
}

} // namespace

int main() {
  TestGlob();
  TestAndAcrossOrWithin();
  TestInstanceTypeFilterSelectsExactly();
  TestListValuedAttributeMatchesAnyElement();
  TestTagFilters();
  TestUnknownFilterAndEmptyValuesMatchNothing();
  TestParseFilters();

  std::cout << "vera_unit_filter_evaluator: pass\n";
  return 0;
}
