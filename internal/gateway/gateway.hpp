#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/gateway/action_router.hpp"
#include "internal/gateway/service_catalog.hpp"
#include "internal/model/resource_type.hpp"

namespace vera::gateway {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Transport-neutral request as handed over by the HTTP layer.
struct ApiRequest {
  std::string method = "POST";
  std::string target = "/"; // path plus optional query string
  HeaderList  headers;
  std::string body;

  // Case-insensitive header lookup.
  std::optional<std::string_view> Header(std::string_view name) const;
};

struct ApiResponse {
  unsigned    status = 200;
  std::string content_type;
  std::string body;
  HeaderList  headers;
};

struct GatewayOptions {
  std::string default_service = "ec2";
  std::string region          = "us-east-1";
  std::string account_id      = "000000000000";
};

/*
  Gateway

  decode -> route -> encode. Never looks at resource semantics; every typed
  error a handler raises is turned into the service's error envelope here,
  so no request ends as a transport failure.

  Service resolution order:
    1. X-Amz-Target prefix (JSON protocol services)
    2. SigV4 credential scope in Authorization (service and region)
    3. the configured default service and region
*/
class Gateway {
 public:
  Gateway(std::shared_ptr<const ServiceCatalog> catalog, std::shared_ptr<const ActionRouter> router,
          std::shared_ptr<const model::ResourceTypeRegistry> registry, GatewayOptions options = {});

  ApiResponse Handle(const ApiRequest& request);

  std::uint64_t requests_served() const {
    return served_.load(std::memory_order_relaxed);
  }
  std::uint64_t requests_failed() const {
    return failed_.load(std::memory_order_relaxed);
  }

 private:
  struct Resolved {
    const ServiceDefinition* service = nullptr;
    std::string              action;
    std::string              region;
    model::Value             params;
  };

  Resolved Decode(const ApiRequest& request) const;

  std::shared_ptr<const ServiceCatalog>              catalog_;
  std::shared_ptr<const ActionRouter>                router_;
  std::shared_ptr<const model::ResourceTypeRegistry> registry_;
  GatewayOptions                                     options_;
  ServiceDefinition                                  fallback_service_;

  std::atomic<std::uint64_t> served_{0};
  std::atomic<std::uint64_t> failed_{0};
};

// Service and region named by "AWS4-HMAC-SHA256 Credential=<key>/<date>/<region>/<service>/aws4_request, ...".
struct CredentialScope {
  std::string region;
  std::string service;
};
std::optional<CredentialScope> ParseCredentialScope(std::string_view authorization);

} // namespace vera::gateway
