#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace vera::store {
class ResourceStore;
}
namespace vera::gateway {
class ActionRouter;
class Gateway;
} // namespace vera::gateway

namespace vera::service {

/*
  Dependency container for the admin plane.
*/
struct ServiceContext {
  std::shared_ptr<store::ResourceStore>        store;
  std::shared_ptr<const gateway::ActionRouter> router;
  std::shared_ptr<const gateway::Gateway>      gateway;
  util::TimePoint                              started_at = util::Now();
};

} // namespace vera::service
