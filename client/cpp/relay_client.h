#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "relay/v1.hpp"

namespace relay::client {

// A failed RPC. code() is the gRPC status the relay answered with.
class RpcError : public std::runtime_error {
 public:
  RpcError(grpc::StatusCode code, const std::string& action, const std::string& message)
      : std::runtime_error(action + " failed: " + message), code_(code), detail_(message) {}

  grpc::StatusCode   code() const { return code_; }
  const std::string& detail() const { return detail_; }

 private:
  grpc::StatusCode code_;
  std::string      detail_;
};

class RelayClient {
 public:
  explicit RelayClient(std::shared_ptr<grpc::Channel> channel, std::string secret = {});

  void SetSecret(std::string secret) { secret_ = std::move(secret); }

  // Zero disables the per-call deadline.
  void SetDeadline(std::chrono::milliseconds deadline) { deadline_ = deadline; }

  static std::string BearerHeader(const std::string& secret);

  // Tools
  relay::v1::HealthResponse    Health() const;
  relay::v1::ListToolsResponse ListTools() const;
  relay::v1::ExecutionUnit     Execute(const std::string& tool, const google::protobuf::Struct& arguments) const;
  relay::v1::RunResponse       Run(const std::string& agent_id, const std::string& tool, const google::protobuf::Struct& arguments,
                                   uint32_t timeout_ms = 0) const;

  // Dispatch
  relay::v1::SendCommandResponse SendCommand(const std::string& agent_id, const std::string& type, const google::protobuf::Value& payload,
                                             uint32_t timeout_ms = 0) const;
  relay::v1::ListAgentsResponse  ListAgents() const;
  relay::v1::AgentSummary        GetAgent(const std::string& agent_id) const;

  // Networks
  relay::v1::NetworkAllocation       Allocate(const std::string& tenant_id) const;
  relay::v1::NetworkAllocation       AttachRelay(const std::string& tenant_id) const;
  relay::v1::NetworkAllocation       Release(const std::string& tenant_id) const;
  relay::v1::NetworkAllocation       ConfirmTeardown(const std::string& tenant_id) const;
  relay::v1::NetworkAllocation       GetAllocation(const std::string& tenant_id) const;
  relay::v1::ListAllocationsResponse ListAllocations() const;

  // Admin
  relay::v1::StatsResponse        Stats() const;
  relay::v1::CreateTenantResponse CreateTenant(const std::string& name, const std::string& resource_name = {}) const;
  void                            InvalidateCredential(const std::string& secret) const;

 private:
  void PrepareContext(grpc::ClientContext* ctx, std::chrono::milliseconds deadline) const;

  std::unique_ptr<relay::v1::ToolService::Stub>     tool_stub_;
  std::unique_ptr<relay::v1::DispatchService::Stub> dispatch_stub_;
  std::unique_ptr<relay::v1::NetworkService::Stub>  network_stub_;
  std::unique_ptr<relay::v1::AdminService::Stub>    admin_stub_;

  std::string               secret_;
  std::chrono::milliseconds deadline_{0};
};

} // namespace relay::client
