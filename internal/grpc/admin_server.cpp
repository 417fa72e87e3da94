#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace vera::grpc {

using namespace vera::admin::v1;

namespace {

// Runs one admin call and turns any exception into a status.
template <typename Call>
::grpc::Status Dispatch(const char* rpc, Call&& call) {
  try {
    call();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    VERA_LOG_WARN("admin rpc failed", {observability::StringField("rpc", rpc), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<vera::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Dispatch("Stats", [&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::Reset(::grpc::ServerContext*, const ResetRequest* req, ResetResponse* resp) {
  return Dispatch("Reset", [&] { *resp = service_->Reset(*req); });
}

::grpc::Status AdminServer::ListRoutes(::grpc::ServerContext*, const ListRoutesRequest* req, ListRoutesResponse* resp) {
  return Dispatch("ListRoutes", [&] { *resp = service_->ListRoutes(*req); });
}

} // namespace vera::grpc
