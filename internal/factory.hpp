#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/gateway/gateway.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/store/resource_store.hpp"

#if VERA_ENABLE_ADMIN_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace vera::factory {

/*
  Application

  Owns every long-lived object of the server. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<const model::ResourceTypeRegistry> registry;
  std::shared_ptr<store::ResourceStore>              store;
  std::shared_ptr<const gateway::ActionRouter>       router;
  std::shared_ptr<gateway::Gateway>                  gateway;
  std::shared_ptr<service::AdminService>             admin_service;

#if VERA_ENABLE_ADMIN_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Build

  Composition root: the only place that knows the concrete handler set.
  Throws when the configuration names unknown resource types or services, or
  when the routing table does not cover the service catalog.
*/
Application Build(const vera::runtime::config::RuntimeConfig& config);

} // namespace vera::factory
