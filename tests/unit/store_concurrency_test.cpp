#include <cassert>

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/store/resource_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/handler_harness.hpp"

namespace {

using vera::model::ResourceType;
using vera::model::ResourceTypeRegistry;
using vera::model::Value;
using vera::store::ResourceStore;
using vera::testing::HandlerHarness;
using vera::testing::List;

std::shared_ptr<const ResourceTypeRegistry> Registry() {
  return std::make_shared<const ResourceTypeRegistry>(ResourceTypeRegistry::BuiltIn());
}

void TestConcurrentCreatesYieldDistinctIds() {
  ResourceStore store(Registry());

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 200;

  std::mutex               ids_mutex;
  std::vector<std::string> ids;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(store.Create(ResourceType::kVpc, Value::Map({{"CidrBlock", "10.0.0.0/16"}})).id);
      }
      std::lock_guard lock(ids_mutex);
      ids.insert(ids.end(), local.begin(), local.end());
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const std::set<std::string> unique(ids.begin(), ids.end());
  assert(ids.size() == static_cast<std::size_t>(kThreads * kPerThread));
  assert(unique.size() == ids.size());
  assert(store.List(ResourceType::kVpc).size() == ids.size());
}

// A delete racing a create that references the same VPC ends in exactly one
// failure: either the subnet exists and the VPC survived, or the VPC is gone
// and the subnet was never created.
void TestDeleteRacingReferencingCreate() {
  for (int round = 0; round < 100; ++round) {
    ResourceStore store(Registry());
    const auto    vpc = store.Create(ResourceType::kVpc, Value::Map({{"CidrBlock", "10.0.0.0/16"}}));

    std::atomic<bool> go{false};
    bool              created = false;
    bool              deleted = false;

    std::thread creator([&] {
      while (!go.load()) {
      }
      try {
        (void)store.Create(ResourceType::kSubnet, Value::Map({{"VpcId", vpc.id}, {"CidrBlock", "10.0.0.0/24"}}));
        created = true;
      } catch (const vera::util::NotFound&) {
      }
    });
    std::thread deleter([&] {
      while (!go.load()) {
      }
      try {
        store.Delete(ResourceType::kVpc, vpc.id);
        deleted = true;
      } catch (const vera::util::DependencyViolation&) {
      }
    });

    go.store(true);
    creator.join();
    deleter.join();

    assert(created != deleted);
    assert(store.Lookup(vpc.id).has_value() == created);
    assert(store.List(ResourceType::kSubnet).size() == (created ? 1u : 0u));
  }
}

void TestReadersSeeConsistentTags() {
  ResourceStore store(Registry());
  const auto    vpc = store.Create(ResourceType::kVpc, Value::Map());

  std::atomic<bool> stop{false};
  std::thread       writer([&] {
    for (int i = 0; i < 500; ++i) {
      store.TagResource(vpc.id, {{"A", std::to_string(i)}, {"B", std::to_string(i)}});
    }
    stop.store(true);
  });

  // Both tags are always written together.
  while (!stop.load()) {
    const auto snapshot = store.Get(ResourceType::kVpc, vpc.id);
    const auto* a       = snapshot.FindTag("A");
    const auto* b       = snapshot.FindTag("B");
    assert((a == nullptr) == (b == nullptr));
    if (a) assert(a->value == b->value);
  }
  writer.join();
}

// A reader never sees a VPC whose default group, main route table or default
// ACL has not been written yet.
void TestVpcNeverVisibleWithoutDefaults() {
  HandlerHarness h;

  std::atomic<bool> stop{false};
  std::thread       writer([&] {
    for (int i = 0; i < 200; ++i) {
      h.Call("CreateVpc", Value::Map({{"CidrBlock", "10.0.0.0/16"}}));
    }
    stop.store(true);
  });

  const auto vpcs_of = [&](ResourceType type) {
    std::set<std::string> vpc_ids;
    for (const auto& resource : h.store().List(type)) {
      if (type == ResourceType::kRouteTable && resource.attributes.FindPath("Associations")->at(0).GetString("RouteTableId") != resource.id) continue;
      vpc_ids.insert(resource.attributes.GetString("VpcId"));
    }
    return vpc_ids;
  };

  bool done = false;
  while (!done) {
    done = stop.load();
    const auto vpcs   = h.store().List(ResourceType::kVpc);
    const auto groups = vpcs_of(ResourceType::kSecurityGroup);
    const auto tables = vpcs_of(ResourceType::kRouteTable);
    const auto acls   = vpcs_of(ResourceType::kNetworkAcl);
    for (const auto& vpc : vpcs) {
      assert(groups.contains(vpc.id));
      assert(tables.contains(vpc.id));
      assert(acls.contains(vpc.id));
    }
  }
  writer.join();
  assert(h.store().List(ResourceType::kVpc).size() == 200);
}

// Start racing Terminate on a stopped instance always ends terminated, with the
// address back in its subnet.
void TestStartRacingTerminate() {
  for (int round = 0; round < 50; ++round) {
    HandlerHarness h;
    h.Call("CreateDefaultVpc");
    const auto launched = h.Call("RunInstances", Value::Map({{"ImageId", "ami-12345678"}})).Find("Instances")->at(0);
    const auto id        = launched.GetString("InstanceId");
    const auto subnet_id = launched.GetString("SubnetId");
    const auto ids       = Value::Map({{"InstanceId", List({id})}});
    h.Call("StopInstances", ids);

    std::atomic<bool> go{false};
    std::string       start_error;
    std::thread       starter([&] {
      while (!go.load()) {
      }
      start_error = h.ErrorCode("StartInstances", ids);
    });
    std::thread terminator([&] {
      while (!go.load()) {
      }
      h.Call("TerminateInstances", ids);
    });
    go.store(true);
    starter.join();
    terminator.join();

    assert(start_error.empty() || start_error == "IncorrectInstanceState");
    assert(h.store().Get(ResourceType::kInstance, id).state == "terminated");
    assert(h.store().Get(ResourceType::kSubnet, subnet_id).attributes.GetString("AvailableIpAddressCount") == "4091");
  }
}

} // namespace

int main() {
  TestConcurrentCreatesYieldDistinctIds();
  TestDeleteRacingReferencingCreate();
  TestReadersSeeConsistentTags();
  TestVpcNeverVisibleWithoutDefaults();
  TestStartRacingTerminate();

  std::cout << "vera_unit_store_concurrency: pass\n";
  return 0;
}
