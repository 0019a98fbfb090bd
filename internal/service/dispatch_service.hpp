#pragma once

#include "internal/dispatch/command_handle.hpp"
#include "relay/v1.hpp"
#include "service_context.hpp"

namespace relay::service {

class DispatchService {
public:
  explicit DispatchService(ServiceContext ctx);

  relay::dispatch::CommandHandle SendCommand(const relay::v1::SendCommandRequest& req);

  relay::v1::ListAgentsResponse ListAgents() const;

  relay::v1::AgentSummary GetAgent(const relay::v1::GetAgentRequest& req) const;

private:
  ServiceContext ctx_;
};

} // namespace relay::service
