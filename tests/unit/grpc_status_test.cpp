#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

using vera::grpc::ToStatus;
using vera::model::ResourceType;

void TestErrorCategoriesMapToStatusCodes() {
  assert(ToStatus(vera::util::NotFound(ResourceType::kVpc, "vpc-1", "missing")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(vera::util::NotFound(std::nullopt, "x-1", "missing")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(vera::util::MalformedParameter("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(vera::util::ValidationFailed("InvalidSubnet.Range", "bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(vera::util::DependencyViolation("in use")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(vera::util::UnsupportedAction("ec2", "Fly")).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
  assert(ToStatus(vera::util::InternalError("ids exhausted")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::logic_error("other")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestStatusKeepsMessage() {
  const auto status = ToStatus(vera::util::DependencyViolation("The vpc 'vpc-1' has dependencies and cannot be deleted."));
  assert(status.error_message() == "The vpc 'vpc-1' has dependencies and cannot be deleted.");
}

void TestAdminServerReturnsOk() {
  auto app = vera::factory::Build(vera::config::ConfigLoader::Defaults());
  vera::grpc::AdminServer server(app.admin_service);

  vera::admin::v1::ResetRequest  reset_req;
  vera::admin::v1::ResetResponse reset_resp;
  ::grpc::ServerContext          reset_ctx;
  const auto                     reset_status = server.Reset(&reset_ctx, &reset_req, &reset_resp);
  assert(reset_status.ok());
  assert(reset_resp.resources_removed() == 0);

  vera::admin::v1::ListRoutesRequest routes_req;
  routes_req.set_service("ec2");
  vera::admin::v1::ListRoutesResponse routes_resp;
  ::grpc::ServerContext               routes_ctx;
  const auto                          routes_status = server.ListRoutes(&routes_ctx, &routes_req, &routes_resp);
  assert(routes_status.ok());
  assert(routes_resp.routes_size() > 0);
  for (const auto& route : routes_resp.routes()) {
    assert(route.service() == "ec2");
  }
}

} // namespace

int main() {
  TestErrorCategoriesMapToStatusCodes();
  TestStatusKeepsMessage();
  TestAdminServerReturnsOk();

  std::cout << "vera_unit_grpc_status: pass\n";
  return 0;
}
