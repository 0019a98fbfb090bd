#pragma once

#include <functional>
#include <string>

#include "relay/v1.hpp"

namespace relay::agent {

/*
  One live executor transport (gRPC stream in production, fakes in tests).

  Handlers are bound once by the registry and may be invoked from any
  transport thread.
*/
class AgentConnection {
 public:
  struct Handlers {
    std::function<void(const relay::v1::AgentMessage&)> on_message;
    std::function<void()>                               on_close;
    std::function<void(const std::string&)>             on_error;
  };

  virtual ~AgentConnection() = default;

  // false when the transport is no longer writable.
  virtual bool Send(const relay::v1::RelayMessage& message) = 0;

  virtual void Bind(Handlers handlers) = 0;

  virtual void Close(const std::string& reason) = 0;

  virtual std::string Peer() const = 0;
};

/*
  Receives protocol events the registry does not handle itself.
  Invoked outside registry locks.
*/
class AgentObserver {
 public:
  virtual ~AgentObserver() = default;

  virtual void OnCommandResponse(const std::string& agent_id, const relay::v1::CommandResponse& response) = 0;
  virtual void OnCommandError(const std::string& agent_id, const relay::v1::CommandError& error)          = 0;

  // session identifies the connection that went away.
  virtual void OnAgentDisconnected(const std::string& agent_id, uint64_t session) = 0;
};

} // namespace relay::agent
