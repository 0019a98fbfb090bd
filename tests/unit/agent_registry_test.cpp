#include <assert.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/agent/agent_registry.hpp"
#include "tests/unit/fake_agent_connection.hpp"

namespace {

using relay::agent::AgentObserver;
using relay::agent::AgentRegistry;
using relay::testing::FakeConnection;

class RecordingObserver : public AgentObserver {
 public:
  void OnCommandResponse(const std::string& agent_id, const relay::v1::CommandResponse& response) override {
    responses.emplace_back(agent_id, response.command_id());
  }

  void OnCommandError(const std::string& agent_id, const relay::v1::CommandError& error) override {
    errors.emplace_back(agent_id, error.error());
  }

  void OnAgentDisconnected(const std::string& agent_id, uint64_t session) override {
    disconnects.emplace_back(agent_id, session);
  }

  std::vector<std::pair<std::string, std::string>> responses;
  std::vector<std::pair<std::string, std::string>> errors;
  std::vector<std::pair<std::string, uint64_t>>    disconnects;
};

google::protobuf::Struct HelloMetadata() {
  google::protobuf::Struct s;
  (*s.mutable_fields())["hostname"].set_string_value("win-01");
  (*s.mutable_fields())["platform"].set_string_value("Windows 11");
  return s;
}

void TestRegisterSendsWelcome() {
  AgentRegistry registry;
  auto          conn = std::make_shared<FakeConnection>();

  const auto session = registry.Register("agent-1", conn, HelloMetadata(), "tenant-a");
  assert(session > 0);
  assert(registry.IsConnected("agent-1"));
  assert(registry.Size() == 1);

  const auto sent = conn->Sent();
  assert(sent.size() == 1);
  assert(sent[0].has_welcome());
  assert(sent[0].welcome().agent_id() == "agent-1");
  assert(sent[0].welcome().timestamp_ms() > 0);

  const auto route = registry.Lookup("agent-1");
  assert(route.has_value());
  assert(route->session == session);
  assert(route->tenant_id == "tenant-a");

  const auto summary = registry.Get("agent-1");
  assert(summary.has_value());
  assert(summary->connected());
  assert(summary->metadata().fields().at("hostname").string_value() == "win-01");
  assert(summary->peer() == conn->Peer());
}

void TestFailedWelcomeUnregisters() {
  AgentRegistry registry;
  auto          conn = std::make_shared<FakeConnection>();
  conn->SetWritable(false);

  (void)registry.Register("agent-1", conn, {});
  assert(!registry.IsConnected("agent-1"));
}

void TestReplacementClosesOldSessionOnly() {
  AgentRegistry     registry;
  RecordingObserver observer;
  registry.SetObserver(&observer);

  auto first  = std::make_shared<FakeConnection>();
  auto second = std::make_shared<FakeConnection>();

  const auto s1 = registry.Register("agent-1", first, {});
  const auto s2 = registry.Register("agent-1", second, {});
  assert(s1 != s2);

  assert(first->Closed());
  assert(observer.disconnects.size() == 1);
  assert(observer.disconnects[0].second == s1);

  // Late close from the replaced transport leaves the new one alone.
  first->DropTransport();
  assert(registry.IsConnected("agent-1"));
  assert(registry.Lookup("agent-1")->session == s2);
  assert(observer.disconnects.size() == 1);

  second->DropTransport();
  assert(!registry.IsConnected("agent-1"));
  assert(observer.disconnects.size() == 2);

  registry.SetObserver(nullptr);
}

void TestTransportErrorUnregisters() {
  AgentRegistry     registry;
  RecordingObserver observer;
  registry.SetObserver(&observer);

  auto conn = std::make_shared<FakeConnection>();
  (void)registry.Register("agent-1", conn, {});
  conn->Fail("connection reset by peer");

  assert(!registry.IsConnected("agent-1"));
  assert(observer.disconnects.size() == 1);
  registry.SetObserver(nullptr);
}

void TestExplicitUnregisterClosesTransport() {
  AgentRegistry registry;
  auto          conn = std::make_shared<FakeConnection>();
  (void)registry.Register("agent-1", conn, {});

  assert(registry.Unregister("agent-1"));
  assert(conn->Closed());
  assert(!registry.Unregister("agent-1"));
}

void TestStatusMergesMetadataAndResources() {
  AgentRegistry registry;
  auto          conn = std::make_shared<FakeConnection>();
  (void)registry.Register("agent-1", conn, HelloMetadata());

  relay::v1::AgentMessage status;
  auto*                   fields = status.mutable_status()->mutable_status()->mutable_fields();
  (*fields)["platform"].set_string_value("Windows Server");
  auto* list = (*fields)["activeContainers"].mutable_list_value();
  list->add_values()->set_string_value("c1");
  (*list->add_values()->mutable_struct_value()->mutable_fields())["Id"].set_string_value("c2");
  conn->Deliver(status);

  const auto summary = registry.Get("agent-1");
  assert(summary->metadata().fields().at("platform").string_value() == "Windows Server");
  assert(summary->metadata().fields().at("hostname").string_value() == "win-01");
  assert(summary->active_resources_size() == 2);
  assert(summary->active_resources(0) == "c1");
  assert(summary->active_resources(1) == "c2");
}

void TestRepliesReachObserver() {
  AgentRegistry     registry;
  RecordingObserver observer;
  registry.SetObserver(&observer);

  auto conn = std::make_shared<FakeConnection>();
  (void)registry.Register("agent-1", conn, {});

  google::protobuf::Value result;
  result.set_string_value("ok");
  conn->Reply("cmd-1", result);
  conn->ReplyError("cmd-2", "boom");

  relay::v1::AgentMessage beat;
  beat.mutable_heartbeat();
  conn->Deliver(beat);

  assert(observer.responses.size() == 1);
  assert(observer.responses[0] == std::make_pair(std::string("agent-1"), std::string("cmd-1")));
  assert(observer.errors.size() == 1);
  assert(observer.errors[0].second == "boom");

  registry.SetObserver(nullptr);
}

void TestListReportsEveryAgent() {
  AgentRegistry registry;
  (void)registry.Register("agent-1", std::make_shared<FakeConnection>(), {});
  (void)registry.Register("agent-2", std::make_shared<FakeConnection>(), {});

  const auto agents = registry.List();
  assert(agents.size() == 2);
  assert(!registry.Get("agent-3").has_value());
}

} // namespace

int main() {
  TestRegisterSendsWelcome();
  TestFailedWelcomeUnregisters();
  TestReplacementClosesOldSessionOnly();
  TestTransportErrorUnregisters();
  TestExplicitUnregisterClosesTransport();
  TestStatusMergesMetadataAndResources();
  TestRepliesReachObserver();
  TestListReportsEveryAgent();

  std::cout << "relay_unit_agent_registry: pass\n";
  return 0;
}
