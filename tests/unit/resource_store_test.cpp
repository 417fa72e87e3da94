#include "internal/store/resource_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using vera::model::Resource;
using vera::model::ResourceType;
using vera::model::ResourceTypeRegistry;
using vera::model::Value;
using vera::store::ResourceStore;
using vera::store::StoreOptions;
using vera::store::StoreTransaction;
using vera::store::StoreView;

std::shared_ptr<const ResourceTypeRegistry> Registry() {
  return std::make_shared<const ResourceTypeRegistry>(ResourceTypeRegistry::BuiltIn());
}

Resource CreateVpc(ResourceStore& store) {
  return store.Create(ResourceType::kVpc, Value::Map({{"CidrBlock", "10.0.0.0/16"}}));
}

Resource CreateSubnet(ResourceStore& store, const std::string& vpc_id) {
  return store.Create(ResourceType::kSubnet, Value::Map({{"VpcId", vpc_id}, {"CidrBlock", "10.0.1.0/24"}}));
}

void TestCreateAssignsIdAndInitialState() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  assert(vpc.id.starts_with("vpc-"));
  assert(vpc.id.size() == 4 + 17);
  assert(vpc.state == "available");
  assert(vpc.attributes.GetString("VpcId") == vpc.id);

  const auto fetched = store.Get(ResourceType::kVpc, vpc.id);
  assert(fetched.attributes == vpc.attributes);
  assert(store.Lookup(vpc.id).has_value());
  assert(!store.Lookup("vpc-missing").has_value());
  assert(store.List(ResourceType::kVpc).size() == 1);
}

void TestGetOfWrongTypeIsNotFound() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  bool threw = false;
  try {
    (void)store.Get(ResourceType::kSubnet, vpc.id);
  } catch (const vera::util::NotFound& e) {
    threw = e.type() == ResourceType::kSubnet && e.id() == vpc.id;
  }
  assert(threw);
}

void TestDanglingReferenceRejected() {
  ResourceStore store(Registry());

  bool threw = false;
  try {
    (void)CreateSubnet(store, "vpc-0000000000000000a");
  } catch (const vera::util::NotFound& e) {
    threw = e.type() == ResourceType::kVpc;
  }
  assert(threw);
  assert(store.List(ResourceType::kSubnet).empty());
}

void TestReferencedResourceCannotBeDeleted() {
  ResourceStore store(Registry());
  const auto    vpc    = CreateVpc(store);
  const auto    subnet = CreateSubnet(store, vpc.id);

  const auto referencers = store.ReferencersOf(vpc.id);
  assert(referencers.size() == 1 && referencers[0] == subnet.id);

  bool threw = false;
  try {
    store.Delete(ResourceType::kVpc, vpc.id);
  } catch (const vera::util::DependencyViolation&) {
    threw = true;
  }
  assert(threw);
  assert(store.Lookup(vpc.id).has_value());
  assert(store.Lookup(subnet.id).has_value());

  store.Delete(ResourceType::kSubnet, subnet.id);
  store.Delete(ResourceType::kVpc, vpc.id);
  assert(!store.Lookup(vpc.id).has_value());
  assert(store.ReferencersOf(vpc.id).empty());
}

void TestDefaultsCascadeWithTheirVpc() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  const auto group = store.Create(ResourceType::kSecurityGroup, Value::Map({{"VpcId", vpc.id}, {"GroupName", "default"}}));

  auto associations = Value::List();
  associations.Append(Value::Map({{"Main", true}}));
  auto table_attrs = Value::Map({{"VpcId", vpc.id}});
  table_attrs.Set("Associations", associations);
  const auto table = store.Create(ResourceType::kRouteTable, table_attrs);

  const auto acl = store.Create(ResourceType::kNetworkAcl, Value::Map({{"VpcId", vpc.id}, {"IsDefault", true}}));

  store.Delete(ResourceType::kVpc, vpc.id);
  assert(!store.Lookup(group.id).has_value());
  assert(!store.Lookup(table.id).has_value());
  assert(!store.Lookup(acl.id).has_value());
}

void TestNonDefaultGroupBlocksVpcDelete() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);
  (void)store.Create(ResourceType::kSecurityGroup, Value::Map({{"VpcId", vpc.id}, {"GroupName", "web"}}));

  bool threw = false;
  try {
    store.Delete(ResourceType::kVpc, vpc.id);
  } catch (const vera::util::DependencyViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestTerminalReferencerDoesNotBlock() {
  ResourceStore store(Registry());
  const auto    vpc      = CreateVpc(store);
  const auto    subnet   = CreateSubnet(store, vpc.id);
  const auto    instance = store.Create(ResourceType::kInstance, Value::Map({{"SubnetId", subnet.id}}));
  assert(instance.state == "pending");

  store.Update(ResourceType::kInstance, instance.id, [](Resource& r) { r.state = "terminated"; });
  store.Delete(ResourceType::kSubnet, subnet.id);

  // The terminated instance remains visible.
  assert(store.Lookup(instance.id).has_value());
}

void TestUpdateIsAtomic() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  bool threw = false;
  try {
    store.Update(ResourceType::kVpc, vpc.id, [](Resource& r) {
      r.attributes.Set("CidrBlock", "10.9.0.0/16");
      r.state = "exploded";
    });
  } catch (const vera::util::InternalError&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get(ResourceType::kVpc, vpc.id).attributes.GetString("CidrBlock") == "10.0.0.0/16");

  const auto updated = store.Update(ResourceType::kVpc, vpc.id, [](Resource& r) { r.attributes.Set("CidrBlock", "10.9.0.0/16"); });
  assert(updated.attributes.GetString("CidrBlock") == "10.9.0.0/16");
}

void TestPreconditionsRunBeforeMutation() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  bool threw = false;
  try {
    store.Delete(ResourceType::kVpc, vpc.id, [](const StoreView&) { throw vera::util::ValidationFailed("OperationNotPermitted", "no"); });
  } catch (const vera::util::ValidationFailed& e) {
    threw = e.code() == "OperationNotPermitted";
  }
  assert(threw);
  assert(store.Lookup(vpc.id).has_value());

  threw = false;
  try {
    (void)store.Create(ResourceType::kVpc, Value::Map(), {}, [&](const StoreView& view) {
      if (!view.List(ResourceType::kVpc).empty()) throw vera::util::ValidationFailed("DefaultVpcAlreadyExists", "exists");
    });
  } catch (const vera::util::ValidationFailed& e) {
    threw = e.code() == "DefaultVpcAlreadyExists";
  }
  assert(threw);
  assert(store.List(ResourceType::kVpc).size() == 1);
}

void TestIdExhaustionIsInternalError() {
  StoreOptions options;
  options.id_max_attempts = 3;
  options.id_source       = [](std::size_t length) { return std::string(length, '0'); };
  ResourceStore store(Registry(), options);

  const auto first = CreateVpc(store);
  assert(first.id == "vpc-00000000000000000");

  bool threw = false;
  try {
    (void)CreateVpc(store);
  } catch (const vera::util::InternalError&) {
    threw = true;
  }
  assert(threw);
  assert(store.List(ResourceType::kVpc).size() == 1);
}

void TestTagging() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);

  store.TagResource(vpc.id, {{"Name", "main"}, {"Env", "dev"}});
  const auto merged = store.TagResource(vpc.id, {{"Env", "prod"}});
  assert(merged.tags.size() == 2);
  assert(merged.tags[0].key == "Name");
  assert(merged.FindTag("Env")->value == "prod");

  // A value selector only removes the tag when it matches.
  auto kept = store.UntagResource(vpc.id, std::vector<vera::store::TagSelector>{{"Env", std::string("dev")}});
  assert(kept.FindTag("Env") != nullptr);
  auto removed = store.UntagResource(vpc.id, std::vector<std::string>{"Env"});
  assert(removed.FindTag("Env") == nullptr);
  assert(removed.tags.size() == 1);

  bool threw = false;
  try {
    store.TagResource("subnet-0123", {{"K", "V"}});
  } catch (const vera::util::NotFound& e) {
    threw = e.type() == ResourceType::kSubnet;
  }
  assert(threw);
}

void TestTerminalStateIsFinal() {
  ResourceStore store(Registry());
  const auto    vpc      = CreateVpc(store);
  const auto    subnet   = CreateSubnet(store, vpc.id);
  const auto    instance = store.Create(ResourceType::kInstance, Value::Map({{"SubnetId", subnet.id}, {"VpcId", vpc.id}}));

  store.Update(ResourceType::kInstance, instance.id, [](Resource& r) { r.state = "terminated"; });
  store.Delete(ResourceType::kSubnet, subnet.id);
  store.Delete(ResourceType::kVpc, vpc.id);

  bool threw = false;
  try {
    store.Update(ResourceType::kInstance, instance.id, [](Resource& r) { r.state = "running"; });
  } catch (const vera::util::ValidationFailed& e) {
    threw = e.code() == "IncorrectState";
  }
  assert(threw);
  assert(store.Get(ResourceType::kInstance, instance.id).state == "terminated");

  // Bookkeeping on the dead record is still allowed and does not revive its references.
  const auto touched = store.Update(ResourceType::kInstance, instance.id, [](Resource& r) { r.attributes.Set("PublicDnsName", ""); });
  assert(touched.state == "terminated");
  assert(store.ReferencersOf(vpc.id).empty());
  assert(store.ReferencersOf(subnet.id).empty());
}

void TestDeletedIdsAreNotReissued() {
  StoreOptions options;
  options.id_max_attempts = 3;
  options.id_source       = [calls = 0](std::size_t length) mutable { return std::string(length, calls++ < 2 ? 'a' : 'b'); };
  ResourceStore store(Registry(), options);

  const auto first = CreateVpc(store);
  assert(first.id == "vpc-aaaaaaaaaaaaaaaaa");
  store.Delete(ResourceType::kVpc, first.id);

  // The second draw repeats the deleted id and is skipped.
  const auto second = CreateVpc(store);
  assert(second.id == "vpc-bbbbbbbbbbbbbbbbb");

  // Reset retires live ids as well.
  store.Reset();
  bool threw = false;
  try {
    (void)CreateVpc(store);
  } catch (const vera::util::InternalError&) {
    threw = true;
  }
  assert(threw);
  assert(store.List(ResourceType::kVpc).empty());
}

void TestTransactionRollsBack() {
  ResourceStore store(Registry());
  const auto    vpc    = CreateVpc(store);
  const auto    subnet = CreateSubnet(store, vpc.id);

  bool threw = false;
  try {
    store.Transact([&](StoreTransaction& tx) {
      tx.Update(ResourceType::kVpc, vpc.id, [](Resource& r) { r.attributes.Set("CidrBlock", "10.9.0.0/16"); });
      tx.Delete(ResourceType::kSubnet, subnet.id);
      const auto added = tx.Create(ResourceType::kVpc, Value::Map({{"CidrBlock", "10.1.0.0/16"}}));
      (void)tx.Create(ResourceType::kSubnet, Value::Map({{"VpcId", added.id}, {"CidrBlock", "10.1.0.0/24"}}));
      assert(tx.List(ResourceType::kVpc).size() == 2);
      assert(tx.List(ResourceType::kSubnet).size() == 1);
      throw vera::util::ValidationFailed("InvalidParameterValue", "abort");
    });
  } catch (const vera::util::ValidationFailed&) {
    threw = true;
  }
  assert(threw);

  assert(store.Get(ResourceType::kVpc, vpc.id).attributes.GetString("CidrBlock") == "10.0.0.0/16");
  assert(store.List(ResourceType::kVpc).size() == 1);
  const auto subnets = store.List(ResourceType::kSubnet);
  assert(subnets.size() == 1);
  assert(subnets[0].id == subnet.id);
  assert(store.ReferencersOf(vpc.id) == std::vector<std::string>{subnet.id});

  // The restored subnet still guards its VPC.
  threw = false;
  try {
    store.Delete(ResourceType::kVpc, vpc.id);
  } catch (const vera::util::DependencyViolation&) {
    threw = true;
  }
  assert(threw);

  // A body that returns commits every write.
  std::string added_id;
  store.Transact([&](StoreTransaction& tx) {
    added_id = tx.Create(ResourceType::kVpc, Value::Map({{"CidrBlock", "10.2.0.0/16"}})).id;
    tx.Delete(ResourceType::kSubnet, subnet.id);
  });
  assert(store.Lookup(added_id).has_value());
  assert(store.List(ResourceType::kSubnet).empty());
}

void TestResetClearsEverything() {
  ResourceStore store(Registry());
  const auto    vpc = CreateVpc(store);
  (void)CreateSubnet(store, vpc.id);

  store.Reset();
  for (const auto& [type, count] : store.Counts()) {
    assert(count == 0);
  }
}

} // namespace

int main() {
  TestCreateAssignsIdAndInitialState();
  TestGetOfWrongTypeIsNotFound();
  TestDanglingReferenceRejected();
  TestReferencedResourceCannotBeDeleted();
  TestDefaultsCascadeWithTheirVpc();
  TestNonDefaultGroupBlocksVpcDelete();
  TestTerminalReferencerDoesNotBlock();
  TestUpdateIsAtomic();
  TestPreconditionsRunBeforeMutation();
  TestIdExhaustionIsInternalError();
  TestTagging();
  TestTerminalStateIsFinal();
  TestDeletedIdsAreNotReissued();
  TestTransactionRollsBack();
  TestResetClearsEverything();

  std::cout << "vera_unit_resource_store: pass\n";
  return 0;
}
