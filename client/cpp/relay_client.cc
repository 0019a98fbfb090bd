#include "client/cpp/relay_client.h"

#include <grpcpp/client_context.h>

#include <algorithm>
#include <string>

namespace relay::client {

namespace {

void ThrowIfError(const grpc::Status& status, const std::string& action) {
  if (!status.ok()) {
    throw RpcError(status.error_code(), action, status.error_message());
  }
}

relay::v1::TenantNetworkRequest TenantRequest(const std::string& tenant_id) {
  relay::v1::TenantNetworkRequest req;
  req.set_tenant_id(tenant_id);
  return req;
}

// Remote execution waits on the agent, so the RPC deadline must outlast the command timeout.
std::chrono::milliseconds CommandDeadline(std::chrono::milliseconds base, uint32_t timeout_ms) {
  if (base.count() == 0) return base;
  return std::max(base, std::chrono::milliseconds(timeout_ms) + std::chrono::seconds(5));
}

} // namespace

RelayClient::RelayClient(std::shared_ptr<grpc::Channel> channel, std::string secret)
    : tool_stub_(relay::v1::ToolService::NewStub(channel)),
      dispatch_stub_(relay::v1::DispatchService::NewStub(channel)),
      network_stub_(relay::v1::NetworkService::NewStub(channel)),
      admin_stub_(relay::v1::AdminService::NewStub(std::move(channel))),
      secret_(std::move(secret)) {}

std::string RelayClient::BearerHeader(const std::string& secret) {
  return "Bearer " + secret;
}

void RelayClient::PrepareContext(grpc::ClientContext* ctx, std::chrono::milliseconds deadline) const {
  if (!secret_.empty()) {
    ctx->AddMetadata("authorization", BearerHeader(secret_));
  }
  if (deadline.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + deadline);
  }
}

// ------------------------------------------------------------
// Tools
// ------------------------------------------------------------

relay::v1::HealthResponse RelayClient::Health() const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::HealthResponse resp;
  ThrowIfError(tool_stub_->Health(&ctx, relay::v1::HealthRequest{}, &resp), "Health");
  return resp;
}

relay::v1::ListToolsResponse RelayClient::ListTools() const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::ListToolsResponse resp;
  ThrowIfError(tool_stub_->ListTools(&ctx, relay::v1::ListToolsRequest{}, &resp), "ListTools");
  return resp;
}

relay::v1::ExecutionUnit RelayClient::Execute(const std::string& tool, const google::protobuf::Struct& arguments) const {
  relay::v1::ExecuteRequest req;
  req.set_tool(tool);
  *req.mutable_arguments() = arguments;

  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::ExecutionUnit resp;
  ThrowIfError(tool_stub_->Execute(&ctx, req, &resp), "Execute");
  return resp;
}

relay::v1::RunResponse RelayClient::Run(const std::string& agent_id, const std::string& tool, const google::protobuf::Struct& arguments,
                                        uint32_t timeout_ms) const {
  relay::v1::RunRequest req;
  req.set_agent_id(agent_id);
  req.set_tool(tool);
  *req.mutable_arguments() = arguments;
  req.set_timeout_ms(timeout_ms);

  grpc::ClientContext ctx;
  PrepareContext(&ctx, CommandDeadline(deadline_, timeout_ms));

  relay::v1::RunResponse resp;
  ThrowIfError(tool_stub_->Run(&ctx, req, &resp), "Run");
  return resp;
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

relay::v1::SendCommandResponse RelayClient::SendCommand(const std::string& agent_id, const std::string& type,
                                                        const google::protobuf::Value& payload, uint32_t timeout_ms) const {
  relay::v1::SendCommandRequest req;
  req.set_agent_id(agent_id);
  req.set_type(type);
  *req.mutable_payload() = payload;
  req.set_timeout_ms(timeout_ms);

  grpc::ClientContext ctx;
  PrepareContext(&ctx, CommandDeadline(deadline_, timeout_ms));

  relay::v1::SendCommandResponse resp;
  ThrowIfError(dispatch_stub_->SendCommand(&ctx, req, &resp), "SendCommand");
  return resp;
}

relay::v1::ListAgentsResponse RelayClient::ListAgents() const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::ListAgentsResponse resp;
  ThrowIfError(dispatch_stub_->ListAgents(&ctx, relay::v1::ListAgentsRequest{}, &resp), "ListAgents");
  return resp;
}

relay::v1::AgentSummary RelayClient::GetAgent(const std::string& agent_id) const {
  relay::v1::GetAgentRequest req;
  req.set_agent_id(agent_id);

  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::AgentSummary resp;
  ThrowIfError(dispatch_stub_->GetAgent(&ctx, req, &resp), "GetAgent");
  return resp;
}

// ------------------------------------------------------------
// Networks
// ------------------------------------------------------------

relay::v1::NetworkAllocation RelayClient::Allocate(const std::string& tenant_id) const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::NetworkAllocation resp;
  ThrowIfError(network_stub_->Allocate(&ctx, TenantRequest(tenant_id), &resp), "Allocate");
  return resp;
}

relay::v1::NetworkAllocation RelayClient::AttachRelay(const std::string& tenant_id) const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::NetworkAllocation resp;
  ThrowIfError(network_stub_->AttachRelay(&ctx, TenantRequest(tenant_id), &resp), "AttachRelay");
  return resp;
}

relay::v1::NetworkAllocation RelayClient::Release(const std::string& tenant_id) const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::NetworkAllocation resp;
  ThrowIfError(network_stub_->Release(&ctx, TenantRequest(tenant_id), &resp), "Release");
  return resp;
}

relay::v1::NetworkAllocation RelayClient::ConfirmTeardown(const std::string& tenant_id) const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::NetworkAllocation resp;
  ThrowIfError(network_stub_->ConfirmTeardown(&ctx, TenantRequest(tenant_id), &resp), "ConfirmTeardown");
  return resp;
}

relay::v1::NetworkAllocation RelayClient::GetAllocation(const std::string& tenant_id) const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::NetworkAllocation resp;
  ThrowIfError(network_stub_->GetAllocation(&ctx, TenantRequest(tenant_id), &resp), "GetAllocation");
  return resp;
}

relay::v1::ListAllocationsResponse RelayClient::ListAllocations() const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::ListAllocationsResponse resp;
  ThrowIfError(network_stub_->ListAllocations(&ctx, relay::v1::ListAllocationsRequest{}, &resp), "ListAllocations");
  return resp;
}

// ------------------------------------------------------------
// Admin
// ------------------------------------------------------------

relay::v1::StatsResponse RelayClient::Stats() const {
  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::StatsResponse resp;
  ThrowIfError(admin_stub_->Stats(&ctx, relay::v1::StatsRequest{}, &resp), "Stats");
  return resp;
}

relay::v1::CreateTenantResponse RelayClient::CreateTenant(const std::string& name, const std::string& resource_name) const {
  relay::v1::CreateTenantRequest req;
  req.set_name(name);
  req.set_resource_name(resource_name);

  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::CreateTenantResponse resp;
  ThrowIfError(admin_stub_->CreateTenant(&ctx, req, &resp), "CreateTenant");
  return resp;
}

void RelayClient::InvalidateCredential(const std::string& secret) const {
  relay::v1::InvalidateCredentialRequest req;
  req.set_secret(secret);

  grpc::ClientContext ctx;
  PrepareContext(&ctx, deadline_);

  relay::v1::InvalidateCredentialResponse resp;
  ThrowIfError(admin_stub_->InvalidateCredential(&ctx, req, &resp), "InvalidateCredential");
}

} // namespace relay::client
