#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using relay::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: relay-server <config.yaml> OR relay-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);
    relay::observability::InitializeLogging(config);

    auto app = relay::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELAY_LOG_INFO("shutting down relay", {relay::observability::IntField("pending", static_cast<int64_t>(app.dispatcher->PendingCount()))});

    // Server first so no new commands arrive, then fail whatever is left.
    server.Stop();
    app.Shutdown();
    relay::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("fatal error", {relay::observability::StringField("error", e.what())});
    relay::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
