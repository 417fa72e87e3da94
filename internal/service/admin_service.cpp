#include "admin_service.hpp"

#include <chrono>

#include "internal/gateway/action_router.hpp"
#include "internal/gateway/gateway.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/resource_store.hpp"

namespace vera::service {

using namespace vera::admin::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) const {
  vera::observability::SpanScope span("AdminService.Stats");

  StatsResponse resp;
  uint64_t      total = 0;
  for (const auto& [type, count] : ctx_.store->Counts()) {
    auto* entry = resp.add_resources();
    entry->set_type(std::string(model::ToString(type)));
    entry->set_count(count);
    total += count;
  }
  resp.set_total_resources(total);

  if (ctx_.gateway) {
    resp.set_requests_served(ctx_.gateway->requests_served());
    resp.set_requests_failed(ctx_.gateway->requests_failed());
  }

  *resp.mutable_started_at() = util::ToProto(ctx_.started_at);
  const auto uptime          = std::chrono::duration_cast<std::chrono::seconds>(util::Now() - ctx_.started_at).count();
  resp.set_uptime_seconds(uptime > 0 ? static_cast<uint64_t>(uptime) : 0);
  return resp;
}

ResetResponse AdminService::Reset(const ResetRequest&) {
  vera::observability::SpanScope span("AdminService.Reset");

  // Counted before the reset; requests racing it may make the number
  // approximate.
  uint64_t removed = 0;
  for (const auto& [type, count] : ctx_.store->Counts()) {
    removed += count;
  }
  ctx_.store->Reset();

  VERA_LOG_WARN("emulator state reset", {vera::observability::IntField("resources_removed", static_cast<std::int64_t>(removed))});

  ResetResponse resp;
  resp.set_resources_removed(removed);
  return resp;
}

ListRoutesResponse AdminService::ListRoutes(const ListRoutesRequest& req) const {
  ListRoutesResponse resp;
  for (const auto& [service, action] : ctx_.router->Routes()) {
    if (!req.service().empty() && req.service() != service) continue;
    auto* route = resp.add_routes();
    route->set_service(service);
    route->set_action(action);
  }
  return resp;
}

} // namespace vera::service
