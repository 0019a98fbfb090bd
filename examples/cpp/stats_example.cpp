#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/relay_client.h"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  relay::client::RelayClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  try {
    const auto stats = client.Stats();
    std::cout << "relay stats for " << target << '\n';
    std::cout << "agents connected: " << stats.agents_connected() << '\n';
    std::cout << "commands: pending=" << stats.commands_pending() << ", completed=" << stats.commands_completed()
              << ", failed=" << stats.commands_failed() << ", timed_out=" << stats.commands_timed_out() << '\n';
    std::cout << "credentials cached: " << stats.credentials_cached() << ", networks: " << stats.networks_allocated() << '\n';
  } catch (const relay::client::RpcError& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  return 0;
}
