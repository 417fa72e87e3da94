#pragma once

#include "internal/gateway/action_router.hpp"
#include "internal/handlers/handler_base.hpp"

namespace vera::handlers {

// Routes every shipped handler: the ec2 resource handlers and sts identity.
void RegisterBuiltInHandlers(gateway::ActionRouter& router, const HandlerDeps& deps);

} // namespace vera::handlers
