#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/dispatch/schedule_worker.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using dispatcher::factory::Build;
using dispatcher::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults: in-memory backend, scheduler off
  } else if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: process-dispatcher [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? dispatcher::config::ConfigLoader::Defaults()
                                      : dispatcher::config::ConfigLoader::LoadFromYaml(config_path);

    dispatcher::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<dispatcher::grpc::RegistryServer>(app.registry_service));
    services.push_back(std::make_unique<dispatcher::grpc::DispatchServer>(app.dispatch_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (app.schedule_worker) {
      app.schedule_worker->Start();
    }
    DISPATCHER_LOG_INFO("Process dispatcher started",
                        {dispatcher::observability::StringField("bind_address", config.server().bind_address()),
                         dispatcher::observability::BoolField("scheduler", config.scheduler().enabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    DISPATCHER_LOG_INFO("Shutting down process dispatcher");

    if (app.schedule_worker) {
      app.schedule_worker->Stop();
    }
    server.Stop();
    dispatcher::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DISPATCHER_LOG_ERROR("Fatal error", {dispatcher::observability::ErrorField(e)});
    dispatcher::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
