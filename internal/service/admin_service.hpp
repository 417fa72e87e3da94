#pragma once

#include "internal/service/service_context.hpp"
#include "vera/admin/v1/admin.pb.h"

namespace vera::service {

/*
  Operator-facing view of the emulator: resource counts, a full reset and
  the routing table. Transport-neutral; grpc/admin_server adapts it.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  vera::admin::v1::StatsResponse      Stats(const vera::admin::v1::StatsRequest& req) const;
  vera::admin::v1::ResetResponse      Reset(const vera::admin::v1::ResetRequest& req);
  vera::admin::v1::ListRoutesResponse ListRoutes(const vera::admin::v1::ListRoutesRequest& req) const;

 private:
  ServiceContext ctx_;
};

} // namespace vera::service
