#include "dispatch_server.hpp"

#include "grpc_error.hpp"
#include "relay/v1.hpp"

namespace relay::grpc {

DispatchServer::DispatchServer(std::shared_ptr<relay::service::DispatchService> svc) : service_(std::move(svc)) {
}

::grpc::ServerUnaryReactor* DispatchServer::SendCommand(::grpc::CallbackServerContext* ctx,
                                                        const relay::v1::SendCommandRequest* req,
                                                        relay::v1::SendCommandResponse* resp) {
  auto* reactor = ctx->DefaultReactor();

  try {
    auto handle = service_->SendCommand(*req);
    handle.OnComplete([reactor, resp](const relay::dispatch::CommandHandle& h) {
      resp->set_command_id(h.CommandId());
      try {
        *resp->mutable_result() = h.Get();
        reactor->Finish(::grpc::Status::OK);
      } catch (const std::exception& e) {
        reactor->Finish(ToStatus(e));
      }
    });
  } catch (const std::exception& e) {
    reactor->Finish(ToStatus(e));
  }

  return reactor;
}

::grpc::Status DispatchServer::ListAgents(::grpc::ServerContext*, const relay::v1::ListAgentsRequest*, relay::v1::ListAgentsResponse* resp) {
  try {
    *resp = service_->ListAgents();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::GetAgent(::grpc::ServerContext*, const relay::v1::GetAgentRequest* req, relay::v1::AgentSummary* resp) {
  try {
    *resp = service_->GetAgent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
