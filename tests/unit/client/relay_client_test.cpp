#include "client/cpp/relay_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using relay::client::RelayClient;
using relay::client::RpcError;

void TestBearerHeaderFormat() {
  assert(RelayClient::BearerHeader("abc123") == "Bearer abc123");
}

void TestRpcErrorCarriesStatus() {
  const RpcError err(grpc::StatusCode::NOT_FOUND, "GetAgent", "Agent a1 not connected");
  assert(err.code() == grpc::StatusCode::NOT_FOUND);
  assert(err.detail() == "Agent a1 not connected");
  assert(std::string(err.what()) == "GetAgent failed: Agent a1 not connected");
}

void TestUnreachableRelayRaisesRpcError() {
  auto channel = grpc::CreateChannel("127.0.0.1:1", grpc::InsecureChannelCredentials());
  RelayClient client(channel, "secret");
  client.SetDeadline(std::chrono::milliseconds(200));

  bool threw = false;
  try {
    (void)client.Health();
  } catch (const RpcError& e) {
    threw = e.code() == grpc::StatusCode::UNAVAILABLE || e.code() == grpc::StatusCode::DEADLINE_EXCEEDED;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBearerHeaderFormat();
  TestRpcErrorCarriesStatus();
  TestUnreachableRelayRaisesRpcError();

  std::cout << "relay_unit_relay_client: pass\n";
  return 0;
}
