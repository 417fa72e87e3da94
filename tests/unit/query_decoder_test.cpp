#include "internal/protocol/query_decoder.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using vera::protocol::DecodeFlat;
using vera::protocol::DecodeOptions;
using vera::protocol::ParamList;
using vera::protocol::ParseFormEncoded;
using vera::protocol::PercentDecode;

bool RejectsAsMalformed(const ParamList& params, const DecodeOptions& options = {}) {
  try {
    (void)DecodeFlat(params, options);
  } catch (const vera::util::MalformedParameter& e) {
    return e.code() == "MalformedQueryString";
  }
  return false;
}

void TestPercentDecoding() {
  assert(PercentDecode("a%20b+c", true) == "a b c");
  assert(PercentDecode("a+b", false) == "a+b");
  assert(PercentDecode("10.0.0.0%2F16", true) == "10.0.0.0/16");

  bool threw = false;
  try {
    (void)PercentDecode("bad%2", true);
  } catch (const vera::util::MalformedParameter&) {
    threw = true;
  }
  assert(threw);
}

void TestFormSplitting() {
  const auto params = ParseFormEncoded("Action=CreateVpc&CidrBlock=10.0.0.0%2F16&&Flag");
  assert(params.size() == 3);
  assert(params[0].first == "Action" && params[0].second == "CreateVpc");
  assert(params[1].second == "10.0.0.0/16");
  assert(params[2].first == "Flag" && params[2].second.empty());
}

void TestFiltersDecodeIntoOrderedList() {
  // Positions arrive out of order; the result is sorted numerically.
  const ParamList params = {
      {"Filter.2.Name", "vpc-id"},
      {"Filter.2.Value.1", "vpc-1"},
      {"Filter.10.Name", "tag:Env"},
      {"Filter.10.Value.1", "prod"},
      {"Filter.1.Name", "instance-type"},
      {"Filter.1.Value.2", "t3.small"},
      {"Filter.1.Value.1", "t2.micro"},
  };

  DecodeOptions options;
  options.allow_sparse_lists = true;
  const auto tree            = DecodeFlat(params, options);

  const auto* filters = tree.Find("Filter");
  assert(filters != nullptr && filters->IsList());
  assert(filters->size() == 3);
  assert(filters->at(0).GetString("Name") == "instance-type");
  assert(filters->at(1).GetString("Name") == "vpc-id");
  assert(filters->at(2).GetString("Name") == "tag:Env");

  const auto* values = filters->at(0).Find("Value");
  assert(values != nullptr && values->size() == 2);
  assert(values->at(0).AsString() == "t2.micro");
  assert(values->at(1).AsString() == "t3.small");
}

void TestGapsRejectedUnlessSparseAllowed() {
  const ParamList params = {{"InstanceId.1", "i-1"}, {"InstanceId.3", "i-3"}};
  assert(RejectsAsMalformed(params));

  DecodeOptions options;
  options.allow_sparse_lists = true;
  const auto tree            = DecodeFlat(params, options);
  assert(tree.Find("InstanceId")->size() == 2);
  assert(tree.Find("InstanceId")->at(1).AsString() == "i-3");
}

void TestLeadingZerosNormalise() {
  const auto tree = DecodeFlat({{"GroupId.01", "sg-1"}, {"GroupId.2", "sg-2"}}, {});
  assert(tree.Find("GroupId")->size() == 2);

  // "01" and "1" name the same position.
  assert(RejectsAsMalformed({{"GroupId.01", "sg-1"}, {"GroupId.1", "sg-1"}}));
}

void TestStructuralConflicts() {
  assert(RejectsAsMalformed({{"Filter.0.Name", "x"}}));
  assert(RejectsAsMalformed({{"Filter..Name", "x"}}));
  assert(RejectsAsMalformed({{"Filter", "x"}, {"Filter.1.Name", "y"}}));
  assert(RejectsAsMalformed({{"Filter.1.Name", "y"}, {"Filter", "x"}}));
  assert(RejectsAsMalformed({{"Filter.1", "x"}, {"Filter.Name", "y"}}));
  assert(RejectsAsMalformed({{"CidrBlock", "10.0.0.0/16"}, {"CidrBlock", "10.1.0.0/16"}}));
  assert(RejectsAsMalformed({{"1", "x"}}));
}

void TestMemberTokenIsTransparent() {
  DecodeOptions options;
  options.list_member_token = "member";

  const auto tree = DecodeFlat({{"Tags.member.1.Key", "Env"}, {"Tags.member.1.Value", "dev"}}, options);
  const auto* tags = tree.Find("Tags");
  assert(tags != nullptr && tags->IsList() && tags->size() == 1);
  assert(tags->at(0).GetString("Key") == "Env");

  assert(RejectsAsMalformed({{"Tags.member.Key", "Env"}}, options));
}

} // namespace

void TestLongListsDecodeInOrder() {
  constexpr int kMembers = 20000;

  ParamList params;
  for (int i = kMembers; i >= 1; --i) {
    params.emplace_back("ResourceId." + std::to_string(i), "vpc-" + std::to_string(i));
    params.emplace_back("Tag." + std::to_string(i) + ".Key", "k" + std::to_string(i));
  }
  const auto tree = DecodeFlat(params, {});

  const auto* ids  = tree.Find("ResourceId");
  const auto* tags = tree.Find("Tag");
  assert(ids != nullptr && ids->size() == kMembers);
  assert(tags != nullptr && tags->size() == kMembers);
  assert(ids->at(0).AsString() == "vpc-1");
  assert(ids->at(kMembers - 1).AsString() == "vpc-" + std::to_string(kMembers));
  assert(tags->at(41).GetString("Key") == "k42");
}

int main() {
  TestPercentDecoding();
  TestFormSplitting();
  TestFiltersDecodeIntoOrderedList();
  TestGapsRejectedUnlessSparseAllowed();
  TestLeadingZerosNormalise();
  TestStructuralConflicts();
  TestMemberTokenIsTransparent();
  TestLongListsDecodeInOrder();

  std::cout << "vera_unit_query_decoder: pass\n";
  return 0;
}
