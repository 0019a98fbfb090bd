#include "tool_service.hpp"

#include <chrono>
#include <optional>

#include <google/protobuf/util/json_util.h>

#include "internal/agent/agent_registry.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payload/payload_builder.hpp"
#include "internal/payload/tool_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::service {

using namespace relay::v1;
using relay::observability::StringField;

namespace {

// The agent receives the unit under its canonical JSON names.
google::protobuf::Value ToValue(const ExecutionUnit& unit) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(unit, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize execution unit: " + status.ToString());
  }

  google::protobuf::Value out;
  status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw std::runtime_error("failed to convert execution unit: " + status.ToString());
  }
  return out;
}

} // namespace

ToolService::ToolService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse ToolService::Health() const {
  HealthResponse resp;
  resp.set_status("ok");
  resp.set_timestamp_ms(static_cast<int64_t>(util::ToUnixMillis(util::Now())));
  return resp;
}

ListToolsResponse ToolService::ListTools(const std::string& secret) {
  ctx_.key_store->Resolve(secret);
  return ctx_.tools->Describe();
}

ExecutionUnit ToolService::Execute(const std::string& secret, const ExecuteRequest& req) {
  const auto tenant = ctx_.key_store->Resolve(secret);

  try {
    const auto invocation = ctx_.tools->Resolve(req.tool(), req.arguments());
    auto       unit       = ctx_.builder->BuildInvocation(invocation, tenant.key);

    RELAY_LOG_INFO("executing tool", {StringField("tool", req.tool()), StringField("tenant_id", tenant.tenant_id)});
    return unit;
  } catch (const std::exception& ex) {
    RELAY_LOG_ERROR("RPC failed", {StringField("route", "ToolService.Execute"), StringField("error", ex.what())});
    throw;
  }
}

relay::dispatch::CommandHandle ToolService::Run(const std::string& secret, const RunRequest& req) {
  const auto tenant = ctx_.key_store->Resolve(secret);

  if (req.agent_id().empty()) {
    throw util::InvalidArgument("agent_id is required");
  }

  // Early answer for the common cases; Send() re-checks the binding on
  // the route it transmits on.
  const auto route = ctx_.agents->Lookup(req.agent_id());
  if (!route) {
    throw util::AgentUnavailable("Agent " + req.agent_id() + " not connected");
  }
  if (!route->tenant_id.empty() && route->tenant_id != tenant.tenant_id) {
    throw util::PermissionDenied("agent " + req.agent_id() + " belongs to another tenant");
  }

  const auto invocation = ctx_.tools->Resolve(req.tool(), req.arguments());
  const auto unit       = ctx_.builder->BuildInvocation(invocation, tenant.key);
  const auto type       = invocation.kind == payload::ToolInvocation::Kind::kCommand ? "shell.exec" : "script.run";

  std::optional<std::chrono::milliseconds> timeout;
  if (req.timeout_ms() > 0) timeout = std::chrono::milliseconds(req.timeout_ms());

  RELAY_LOG_INFO("running tool on agent",
                 {StringField("tool", req.tool()), StringField("agent_id", req.agent_id()), StringField("tenant_id", tenant.tenant_id)});
  return ctx_.dispatcher->Send(req.agent_id(), type, ToValue(unit), timeout, &tenant.tenant_id);
}

} // namespace relay::service
