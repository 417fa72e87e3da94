#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/filter/filter_evaluator.hpp"
#include "internal/gateway/action_router.hpp"
#include "internal/gateway/service_catalog.hpp"
#include "internal/handlers/builtin_handlers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

#if VERA_ENABLE_ADMIN_GRPC
#include "internal/grpc/admin_server.hpp"
#endif

namespace vera::factory {

Application Build(const vera::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto& emulator = config.emulator();

  // ------------------------------------------------------------------
  // Resource model
  // ------------------------------------------------------------------
  auto registry = std::make_shared<model::ResourceTypeRegistry>(model::ResourceTypeRegistry::BuiltIn());
  registry->UseShortIds({emulator.short_id_types().begin(), emulator.short_id_types().end()});
  app.registry = registry;

  store::StoreOptions store_options;
  if (emulator.id_max_attempts() > 0) store_options.id_max_attempts = emulator.id_max_attempts();
  app.store = std::make_shared<store::ResourceStore>(app.registry, store_options);

  auto filters = std::make_shared<filter::FilterEvaluator>(app.registry);

  // ------------------------------------------------------------------
  // Routing
  // ------------------------------------------------------------------
  auto catalog = std::make_shared<gateway::ServiceCatalog>(gateway::DefaultServiceCatalog());
  catalog->AllowSparseLists({emulator.allow_sparse_lists().begin(), emulator.allow_sparse_lists().end()});

  auto router = std::make_shared<gateway::ActionRouter>();
  handlers::RegisterBuiltInHandlers(*router, handlers::HandlerDeps{app.store, filters});
  router->ValidateComplete(*catalog);
  app.router = router;

  gateway::GatewayOptions options;
  options.default_service = emulator.default_service();
  options.region          = emulator.region();
  options.account_id      = emulator.account_id();
  if (!catalog->Find(options.default_service)) {
    throw std::invalid_argument("unknown default_service: " + options.default_service);
  }
  app.gateway = std::make_shared<gateway::Gateway>(catalog, app.router, app.registry, options);

  // ------------------------------------------------------------------
  // Admin plane
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store   = app.store;
  ctx.router  = app.router;
  ctx.gateway = app.gateway;

  app.admin_service = std::make_shared<service::AdminService>(ctx);

#if VERA_ENABLE_ADMIN_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service));
#endif

  VERA_LOG_DEBUG("application built", {observability::IntField("routes", static_cast<std::int64_t>(app.router->Routes().size())),
                                       observability::StringField("region", options.region)});
  return app;
}

} // namespace vera::factory
