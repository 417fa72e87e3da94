#include "internal/service/admin_service.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"

namespace {

using namespace vera::admin::v1;
using vera::gateway::ApiRequest;

vera::factory::Application BuildApp() {
  return vera::factory::Build(vera::config::ConfigLoader::Defaults());
}

void Send(vera::factory::Application& app, const std::string& body) {
  ApiRequest request;
  request.method = "POST";
  request.target = "/";
  request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  request.body = body;
  app.gateway->Handle(request);
}

std::uint64_t CountOf(const StatsResponse& stats, const std::string& type) {
  for (const auto& entry : stats.resources()) {
    if (entry.type() == type) return entry.count();
  }
  return 0;
}

void TestStatsCountResourcesAndRequests() {
  auto app = BuildApp();

  auto stats = app.admin_service->Stats(StatsRequest());
  assert(stats.total_resources() == 0);
  assert(stats.requests_served() == 0);
  assert(stats.resources_size() > 0);

  Send(app, "Action=CreateVpc&CidrBlock=10.0.0.0%2F16");
  Send(app, "Action=DeleteVpc&VpcId=vpc-00000000");

  stats = app.admin_service->Stats(StatsRequest());
  assert(CountOf(stats, "vpc") == 1);
  // Default security group, main route table and default network ACL.
  assert(CountOf(stats, "security-group") == 1);
  assert(stats.total_resources() == 4);
  assert(stats.requests_served() == 2);
  assert(stats.requests_failed() == 1);
  assert(stats.started_at().seconds() > 0);
}

void TestResetClearsEverything() {
  auto app = BuildApp();
  Send(app, "Action=CreateVpc&CidrBlock=10.0.0.0%2F16");
  Send(app, "Action=CreateKeyPair&KeyName=deploy");

  const auto reset = app.admin_service->Reset(ResetRequest());
  assert(reset.resources_removed() == 5);
  assert(app.admin_service->Stats(StatsRequest()).total_resources() == 0);
  assert(app.store->List(vera::model::ResourceType::kVpc).empty());

  // Names are free again after a reset.
  Send(app, "Action=CreateKeyPair&KeyName=deploy");
  assert(app.admin_service->Stats(StatsRequest()).requests_failed() == 0);
}

void TestListRoutes() {
  auto app = BuildApp();

  const auto all = app.admin_service->ListRoutes(ListRoutesRequest());
  bool       run_instances = false;
  bool       sts           = false;
  for (const auto& route : all.routes()) {
    if (route.service() == "ec2" && route.action() == "RunInstances") run_instances = true;
    if (route.service() == "sts") sts = true;
  }
  assert(run_instances);
  assert(sts);

  ListRoutesRequest only_sts;
  only_sts.set_service("sts");
  const auto filtered = app.admin_service->ListRoutes(only_sts);
  assert(filtered.routes_size() == 1);
  assert(filtered.routes(0).action() == "GetCallerIdentity");
}

} // namespace

int main() {
  TestStatsCountResourcesAndRequests();
  TestResetClearsEverything();
  TestListRoutes();

  std::cout << "vera_unit_admin_service: pass\n";
  return 0;
}
