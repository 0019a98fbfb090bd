#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/services/v1/dispatch_service.grpc.pb.h"
#include "internal/service/dispatch_service.hpp"

namespace relay::grpc {

class DispatchServer final
    : public relay::services::v1::DispatchService::WithCallbackMethod_SendCommand<relay::services::v1::DispatchService::Service> {
public:
  explicit DispatchServer(std::shared_ptr<relay::service::DispatchService> svc);

  ::grpc::ServerUnaryReactor* SendCommand(::grpc::CallbackServerContext* ctx,
                                          const relay::agent::v1::SendCommandRequest* req,
                                          relay::agent::v1::SendCommandResponse* resp) override;

  ::grpc::Status ListAgents(::grpc::ServerContext*,
                            const relay::agent::v1::ListAgentsRequest*,
                            relay::agent::v1::ListAgentsResponse* resp) override;

  ::grpc::Status GetAgent(::grpc::ServerContext*,
                          const relay::agent::v1::GetAgentRequest* req,
                          relay::agent::v1::AgentSummary* resp) override;

private:
  std::shared_ptr<relay::service::DispatchService> service_;
};

} // namespace relay::grpc
