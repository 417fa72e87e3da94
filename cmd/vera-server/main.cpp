#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/http_server.hpp"
#if VERA_ENABLE_ADMIN_GRPC
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: vera-server [--config <config.yaml>] [--port <port>]" << std::endl;
}

static void ShutdownObservability() {
  vera::observability::ShutdownLogging();
  vera::observability::ShutdownMetrics();
  vera::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string                  config_path;
  std::optional<std::uint16_t> port_override;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      try {
        const auto port = std::stoul(argv[++i]);
        if (port > 65535) throw std::out_of_range("port");
        port_override = static_cast<std::uint16_t>(port);
      } catch (const std::exception&) {
        std::cerr << "invalid port: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      Usage();
      return 0;
    } else {
      Usage();
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? vera::config::ConfigLoader::Defaults() : vera::config::ConfigLoader::LoadFromYaml(config_path);
    if (port_override) config.mutable_server()->set_port(*port_override);

    vera::observability::InitializeTracing(config);
    vera::observability::InitializeMetrics(config);
    vera::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = vera::factory::Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    vera::runtime::HttpServerOptions http_options;
    http_options.bind_address   = config.server().bind_address();
    http_options.port           = static_cast<std::uint16_t>(config.server().port());
    http_options.threads        = config.server().threads();
    http_options.max_body_bytes = config.server().max_body_bytes();
    vera::runtime::HttpServer http(http_options, app.gateway);

#if VERA_ENABLE_ADMIN_GRPC
    std::unique_ptr<vera::runtime::Server> admin;
    if (config.admin().enabled()) {
      admin = std::make_unique<vera::runtime::Server>(config.admin().bind_address(), std::move(app.grpc_services));
    }
#else
    if (config.admin().enabled()) {
      VERA_LOG_WARN("admin plane requested but this build has no gRPC support");
    }
#endif

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    http.Start();
#if VERA_ENABLE_ADMIN_GRPC
    if (admin) admin->Start();
#endif
    VERA_LOG_INFO("vera started", {vera::observability::StringField("bind_address", http_options.bind_address),
                                   vera::observability::IntField("port", http.port()),
                                   vera::observability::StringField("region", config.emulator().region())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    VERA_LOG_INFO("shutting down");

#if VERA_ENABLE_ADMIN_GRPC
    if (admin) admin->Stop();
#endif
    http.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    VERA_LOG_ERROR("fatal error", {vera::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
