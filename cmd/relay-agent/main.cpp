#include <grpcpp/grpcpp.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/executor/agent_client.hpp"
#include "internal/executor/command_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: relay-agent --relay <host:port> [--agent-id <id>] [--log-level <level>]\n"
            << "                   [--python <bin>] [--powershell <bin>] [--docker <bin>]\n"
            << "\n"
            << "The tenant secret is read from RELAY_AGENT_SECRET.\n";
}

int main(int argc, char** argv) {
  std::string                          relay;
  std::string                          log_level = "info";
  relay::executor::AgentClientOptions  client_options;
  relay::executor::ExecutorOptions     executor_options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    const std::string value = argv[++i];

    if (flag == "--relay") relay = value;
    else if (flag == "--agent-id") client_options.agent_id = value;
    else if (flag == "--log-level") log_level = value;
    else if (flag == "--python") executor_options.python = value;
    else if (flag == "--powershell") executor_options.powershell = value;
    else if (flag == "--docker") executor_options.docker = value;
    else {
      Usage();
      return 1;
    }
  }

  if (relay.empty()) {
    Usage();
    return 1;
  }
  if (client_options.agent_id.empty()) {
    client_options.agent_id = relay::util::NewUUIDString();
  }
  if (const char* secret = std::getenv("RELAY_AGENT_SECRET")) {
    client_options.secret = secret;
  }

  relay::observability::InitializeLogging("relay-agent", log_level);

  try {
    auto executor = std::make_shared<relay::executor::CommandExecutor>(executor_options);
    relay::executor::AgentClient client(grpc::CreateChannel(relay, grpc::InsecureChannelCredentials()), client_options, executor);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    RELAY_LOG_INFO("agent starting", {relay::observability::StringField("relay", relay),
                                      relay::observability::StringField("agent_id", client_options.agent_id)});

    std::thread session([&] { client.Run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    client.Stop();
    session.join();
    relay::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("fatal error", {relay::observability::StringField("error", e.what())});
    relay::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
