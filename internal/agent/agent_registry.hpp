#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/agent/agent_connection.hpp"
#include "internal/util/time.hpp"
#include "relay/v1.hpp"

namespace relay::agent {

// What the dispatcher needs to reach an agent.
struct AgentRoute {
  std::shared_ptr<AgentConnection> connection;
  uint64_t                         session = 0;
  std::string                      tenant_id;
};

/*
  Live executor connections, at most one per agent id.

  - Register() replaces an existing record; the old session is reported
    disconnected and its transport closed.
  - Every connection gets a session number. Close/error events from a
    replaced session never remove the newer record.
  - Unregistration is the only "agent gone" signal forwarded to the
    observer.
*/
class AgentRegistry {
 public:
  explicit AgentRegistry(util::ClockFn clock = util::Now);

  AgentRegistry(const AgentRegistry&)            = delete;
  AgentRegistry& operator=(const AgentRegistry&) = delete;

  uint64_t Register(const std::string&               agent_id,
                    std::shared_ptr<AgentConnection> connection,
                    google::protobuf::Struct         metadata,
                    std::string                      tenant_id = {});

  // Removes whatever session is live and closes its transport.
  bool Unregister(const std::string& agent_id);

  // No-op unless session is still the live one.
  bool Unregister(const std::string& agent_id, uint64_t session);

  void HandleMessage(const std::string& agent_id, uint64_t session, const relay::v1::AgentMessage& message);

  std::optional<AgentRoute>              Lookup(const std::string& agent_id) const;
  std::optional<relay::v1::AgentSummary> Get(const std::string& agent_id) const;
  std::vector<relay::v1::AgentSummary>   List() const;

  bool        IsConnected(const std::string& agent_id) const;
  std::size_t Size() const;

  // Not owned. Pass nullptr to detach; blocks until in-flight callbacks return.
  void SetObserver(AgentObserver* observer);

 private:
  struct Record {
    std::shared_ptr<AgentConnection> connection;
    uint64_t                         session = 0;
    google::protobuf::Struct         metadata;
    util::TimePoint                  last_seen;
    std::vector<std::string>         active_resources;
    std::string                      tenant_id;
  };

  std::optional<Record>   Remove(const std::string& agent_id, const uint64_t* session);
  void                    NotifyDisconnected(const std::string& agent_id, uint64_t session);
  relay::v1::AgentSummary Summarize(const std::string& agent_id, const Record& record) const;

  util::ClockFn clock_;

  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, Record> agents_;
  uint64_t                                next_session_ = 1;

  std::shared_mutex observer_mutex_;
  AgentObserver*    observer_ = nullptr;
};

} // namespace relay::agent
