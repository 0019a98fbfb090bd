#pragma once

#include <string>

#include "internal/dispatch/command_handle.hpp"
#include "relay/v1.hpp"
#include "service_context.hpp"

namespace relay::service {

/*
  Tool catalog, encrypted unit assembly and direct execution on an agent.

  Every call except Health takes the caller's tenant secret.
*/
class ToolService {
public:
  explicit ToolService(ServiceContext ctx);

  relay::v1::HealthResponse Health() const;

  relay::v1::ListToolsResponse ListTools(const std::string& secret);

  relay::v1::ExecutionUnit Execute(const std::string& secret, const relay::v1::ExecuteRequest& req);

  // Builds the unit and sends it to the agent; resolves asynchronously.
  relay::dispatch::CommandHandle Run(const std::string& secret, const relay::v1::RunRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace relay::service
