#include "internal/gateway/gateway.hpp"

#include <chrono>
#include <strings.h>

#include "internal/gateway/api_error.hpp"
#include "internal/gateway/response_encoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/protocol/json_codec.hpp"
#include "internal/protocol/query_decoder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace vera::gateway {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

std::optional<std::string_view> ApiRequest::Header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (EqualsIgnoreCase(key, name)) return std::string_view(value);
  }
  return std::nullopt;
}

std::optional<CredentialScope> ParseCredentialScope(std::string_view authorization) {
  constexpr std::string_view kCredential = "Credential=";

  const auto start = authorization.find(kCredential);
  if (start == std::string_view::npos) return std::nullopt;

  auto credential = authorization.substr(start + kCredential.size());
  credential      = credential.substr(0, credential.find_first_of(", "));

  // <key>/<date>/<region>/<service>/aws4_request
  std::vector<std::string_view> parts;
  while (true) {
    const auto slash = credential.find('/');
    parts.push_back(credential.substr(0, slash));
    if (slash == std::string_view::npos) break;
    credential = credential.substr(slash + 1);
  }
  if (parts.size() != 5 || parts[2].empty() || parts[3].empty()) return std::nullopt;
  return CredentialScope{std::string(parts[2]), std::string(parts[3])};
}

Gateway::Gateway(std::shared_ptr<const ServiceCatalog> catalog, std::shared_ptr<const ActionRouter> router,
                 std::shared_ptr<const model::ResourceTypeRegistry> registry, GatewayOptions options)
    : catalog_(std::move(catalog)), router_(std::move(router)), registry_(std::move(registry)), options_(std::move(options)) {
  // Error envelopes for requests that never resolve to a known service use
  // the default service's protocol, or the ec2 shape when even that is absent.
  if (const auto* fallback = catalog_->Find(options_.default_service)) {
    fallback_service_ = *fallback;
  } else {
    fallback_service_.name     = options_.default_service;
    fallback_service_.protocol = Protocol::kEc2;
  }
}

Gateway::Resolved Gateway::Decode(const ApiRequest& request) const {
  Resolved resolved;
  resolved.region = options_.region;

  if (const auto target = request.Header("X-Amz-Target")) {
    const auto dot = target->rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == target->size()) {
      throw util::MalformedParameter("X-Amz-Target must be <prefix>.<Action>", "MissingAction");
    }
    const auto prefix = target->substr(0, dot);
    resolved.action   = std::string(target->substr(dot + 1));
    resolved.service  = catalog_->FindByTargetPrefix(prefix);
    if (!resolved.service) {
      throw util::UnsupportedAction(std::string(prefix), resolved.action);
    }
    if (const auto auth = request.Header("Authorization")) {
      if (auto scope = ParseCredentialScope(*auth)) resolved.region = scope->region;
    }
    resolved.params = protocol::ParseJson(request.body);
    if (!resolved.params.IsMap()) {
      throw util::MalformedParameter("request body must be a JSON object", "SerializationException");
    }
    return resolved;
  }

  std::string service_name = options_.default_service;
  if (const auto auth = request.Header("Authorization")) {
    if (auto scope = ParseCredentialScope(*auth)) {
      service_name    = scope->service;
      resolved.region = scope->region;
    }
  }

  protocol::ParamList pairs;
  if (const auto query = request.target.find('?'); query != std::string::npos) {
    pairs = protocol::ParseFormEncoded(std::string_view(request.target).substr(query + 1));
  }
  if (!request.body.empty()) {
    auto form = protocol::ParseFormEncoded(request.body);
    pairs.insert(pairs.end(), std::make_move_iterator(form.begin()), std::make_move_iterator(form.end()));
  }

  protocol::ParamList parameters;
  parameters.reserve(pairs.size());
  for (auto& [key, value] : pairs) {
    if (key == "Action") {
      resolved.action = std::move(value);
    } else if (key != "Version") {
      parameters.emplace_back(std::move(key), std::move(value));
    }
  }

  resolved.service = catalog_->Find(service_name);
  if (resolved.action.empty()) {
    throw util::MalformedParameter("The request must contain the parameter Action", "MissingAction");
  }
  if (!resolved.service || resolved.service->protocol == Protocol::kJson) {
    throw util::UnsupportedAction(service_name, resolved.action);
  }

  resolved.params = protocol::DecodeFlat(parameters, resolved.service->decode);
  return resolved;
}

ApiResponse Gateway::Handle(const ApiRequest& request) {
  const auto started    = std::chrono::steady_clock::now();
  const auto request_id = util::NewRequestId();

  const auto path = std::string_view(request.target).substr(0, request.target.find('?'));
  if (request.method == "GET" && path == "/health") {
    return {200, "application/json", R"({"status":"running"})", {}};
  }

  observability::RequestLogScope log_scope(request_id);
  observability::SpanScope       span("vera.request");
  span.SetAttribute("request_id", request_id);

  const ServiceDefinition* service = &fallback_service_;
  std::string              action  = "unknown";
  std::string              error_code;
  ApiResponse              response;

  try {
    auto resolved = Decode(request);
    service       = resolved.service;
    action        = resolved.action;
    span.SetAttribute("service", service->name);
    span.SetAttribute("action", action);

    auto& handler = router_->Resolve(service->name, action);

    RequestContext context{request_id, service->name, resolved.region, options_.account_id};
    const auto     body    = handler.Handle(action, resolved.params, context);
    auto           encoded = EncodeSuccess(*service, action, request_id, body);
    response.status        = 200;
    response.content_type  = std::move(encoded.content_type);
    response.body          = std::move(encoded.body);
  } catch (const std::exception& e) {
    const auto error      = ToApiError(e, *registry_);
    auto       encoded    = EncodeError(*service, error, request_id);
    error_code            = error.code;
    response.status       = error.http_status;
    response.content_type = std::move(encoded.content_type);
    response.body         = std::move(encoded.body);

    span.RecordException(e.what());
    if (error.http_status >= 500) {
      VERA_LOG_ERROR("request failed", {observability::StringField("service", service->name), observability::StringField("action", action),
                                        observability::StringField("error", e.what())});
    } else {
      VERA_LOG_DEBUG("request rejected", {observability::StringField("code", error.code), observability::StringField("error", e.what())});
    }
  }

  response.headers.emplace_back("x-amzn-RequestId", request_id);

  const bool success    = response.status < 400;
  const auto latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  served_.fetch_add(1, std::memory_order_relaxed);
  if (!success) failed_.fetch_add(1, std::memory_order_relaxed);

  observability::Metrics::Instance().RecordRequest(service->name, action, error_code);
  observability::Metrics::Instance().ObserveRequestLatencyMs(service->name, action, latency_ms);
  span.SetAttribute("http.status_code", static_cast<std::int64_t>(response.status));

  const auto level = observability::AccessLogEnabled() ? spdlog::level::info : spdlog::level::debug;
  observability::Log(level, "access",
                     {observability::StringField("service", service->name), observability::StringField("action", action),
                      observability::IntField("status", response.status), observability::StringField("request_id", request_id),
                      observability::DoubleField("latency_ms", latency_ms)});
  return response;
}

} // namespace vera::gateway
