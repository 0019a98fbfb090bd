#include "dispatch_service.hpp"

#include <chrono>
#include <optional>

#include "internal/agent/agent_registry.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/util/errors.hpp"

namespace relay::service {

using namespace relay::v1;

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

relay::dispatch::CommandHandle DispatchService::SendCommand(const SendCommandRequest& req) {
  if (req.agent_id().empty()) {
    throw util::InvalidArgument("agent_id is required");
  }
  if (req.type().empty()) {
    throw util::InvalidArgument("command type is required");
  }

  std::optional<std::chrono::milliseconds> timeout;
  if (req.timeout_ms() > 0) timeout = std::chrono::milliseconds(req.timeout_ms());

  return ctx_.dispatcher->Send(req.agent_id(), req.type(), req.payload(), timeout);
}

ListAgentsResponse DispatchService::ListAgents() const {
  ListAgentsResponse resp;
  for (auto& a : ctx_.agents->List()) {
    *resp.add_agents() = std::move(a);
  }
  return resp;
}

AgentSummary DispatchService::GetAgent(const GetAgentRequest& req) const {
  auto summary = ctx_.agents->Get(req.agent_id());
  if (!summary) {
    throw util::NotFound("Agent " + req.agent_id() + " not found");
  }
  return *summary;
}

} // namespace relay::service
