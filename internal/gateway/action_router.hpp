#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/gateway/resource_handler.hpp"
#include "internal/gateway/service_catalog.hpp"

namespace vera::gateway {

/*
  (service, action) -> handler table.

  Filled once in the composition root, checked against the service catalog
  with ValidateComplete() and read-only afterwards.
*/
class ActionRouter {
 public:
  // Routes every action the handler declares. A route registered twice is a
  // std::logic_error.
  void Register(const std::string& service, std::shared_ptr<ResourceHandler> handler);

  // Throws util::UnsupportedAction when nothing is registered.
  ResourceHandler& Resolve(const std::string& service, const std::string& action) const;

  bool Contains(const std::string& service, const std::string& action) const;

  // Every action the catalog declares must be routed, and every route must be
  // declared. Violations are reported together in one std::logic_error.
  void ValidateComplete(const ServiceCatalog& catalog) const;

  // Sorted by service, then action.
  std::vector<std::pair<std::string, std::string>> Routes() const;

 private:
  std::map<std::pair<std::string, std::string>, std::shared_ptr<ResourceHandler>> routes_;
};

} // namespace vera::gateway
