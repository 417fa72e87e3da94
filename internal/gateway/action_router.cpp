#include "internal/gateway/action_router.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vera::gateway {

void ActionRouter::Register(const std::string& service, std::shared_ptr<ResourceHandler> handler) {
  if (!handler) {
    throw std::logic_error("null handler registered for service " + service);
  }
  for (const auto& action : handler->Actions()) {
    auto [it, inserted] = routes_.emplace(std::make_pair(service, action), handler);
    if (!inserted) {
      throw std::logic_error("route registered twice: " + service + ":" + action);
    }
  }
}

ResourceHandler& ActionRouter::Resolve(const std::string& service, const std::string& action) const {
  auto it = routes_.find({service, action});
  if (it == routes_.end()) {
    throw util::UnsupportedAction(service, action);
  }
  return *it->second;
}

bool ActionRouter::Contains(const std::string& service, const std::string& action) const {
  return routes_.contains({service, action});
}

void ActionRouter::ValidateComplete(const ServiceCatalog& catalog) const {
  std::string problems;

  for (const auto& service : catalog.All()) {
    for (const auto& action : service.actions) {
      if (!Contains(service.name, action)) {
        problems += " missing handler " + service.name + ":" + action + ";";
      }
    }
  }

  for (const auto& [route, handler] : routes_) {
    const auto* service = catalog.Find(route.first);
    const bool  declared =
        service && std::find(service->actions.begin(), service->actions.end(), route.second) != service->actions.end();
    if (!declared) {
      problems += " undeclared route " + route.first + ":" + route.second + ";";
    }
  }

  if (!problems.empty()) {
    throw std::logic_error("action routing incomplete:" + problems);
  }
}

std::vector<std::pair<std::string, std::string>> ActionRouter::Routes() const {
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(routes_.size());
  for (const auto& [route, handler] : routes_) {
    out.push_back(route);
  }
  return out;
}

} // namespace vera::gateway
