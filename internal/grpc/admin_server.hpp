#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "vera/admin/v1/admin.grpc.pb.h"

namespace vera::grpc {

class AdminServer final : public vera::admin::v1::EmulatorAdmin::Service {
 public:
  explicit AdminServer(std::shared_ptr<vera::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const vera::admin::v1::StatsRequest*, vera::admin::v1::StatsResponse*) override;

  ::grpc::Status Reset(::grpc::ServerContext*, const vera::admin::v1::ResetRequest*, vera::admin::v1::ResetResponse*) override;

  ::grpc::Status ListRoutes(::grpc::ServerContext*, const vera::admin::v1::ListRoutesRequest*,
                            vera::admin::v1::ListRoutesResponse*) override;

 private:
  std::shared_ptr<vera::service::AdminService> service_;
};

} // namespace vera::grpc
