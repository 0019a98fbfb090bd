#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/services/v1/tool_service.grpc.pb.h"
#include "internal/service/tool_service.hpp"

namespace relay::grpc {

// Run completes from the dispatcher callback; the rest are synchronous.
class ToolServer final : public relay::services::v1::ToolService::WithCallbackMethod_Run<relay::services::v1::ToolService::Service> {
public:
  explicit ToolServer(std::shared_ptr<relay::service::ToolService> svc);

  ::grpc::Status Health(::grpc::ServerContext*,
                        const relay::core::v1::HealthRequest*,
                        relay::core::v1::HealthResponse*) override;

  ::grpc::Status ListTools(::grpc::ServerContext* ctx,
                           const relay::core::v1::ListToolsRequest*,
                           relay::core::v1::ListToolsResponse* resp) override;

  ::grpc::Status Execute(::grpc::ServerContext* ctx,
                         const relay::core::v1::ExecuteRequest* req,
                         relay::core::v1::ExecutionUnit* resp) override;

  ::grpc::ServerUnaryReactor* Run(::grpc::CallbackServerContext* ctx,
                                  const relay::core::v1::RunRequest* req,
                                  relay::core::v1::RunResponse* resp) override;

private:
  std::shared_ptr<relay::service::ToolService> service_;
};

} // namespace relay::grpc
