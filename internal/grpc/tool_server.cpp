#include "tool_server.hpp"

#include "bearer.hpp"
#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "relay/v1.hpp"

namespace relay::grpc {

using relay::observability::StringField;

namespace {

::grpc::Status Unauthenticated(const ::grpc::ServerContextBase& ctx, const std::exception& e) {
  if (dynamic_cast<const util::AuthError*>(&e)) {
    RELAY_LOG_WARN("auth failed", {StringField("peer", ctx.peer()), StringField("error", e.what())});
  }
  return ToStatus(e);
}

} // namespace

ToolServer::ToolServer(std::shared_ptr<relay::service::ToolService> svc) : service_(std::move(svc)) {
}

::grpc::Status ToolServer::Health(::grpc::ServerContext*, const relay::v1::HealthRequest*, relay::v1::HealthResponse* resp) {
  *resp = service_->Health();
  return ::grpc::Status::OK;
}

::grpc::Status ToolServer::ListTools(::grpc::ServerContext* ctx, const relay::v1::ListToolsRequest*, relay::v1::ListToolsResponse* resp) {
  try {
    *resp = service_->ListTools(BearerSecret(*ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return Unauthenticated(*ctx, e);
  }
}

::grpc::Status ToolServer::Execute(::grpc::ServerContext* ctx, const relay::v1::ExecuteRequest* req, relay::v1::ExecutionUnit* resp) {
  try {
    *resp = service_->Execute(BearerSecret(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return Unauthenticated(*ctx, e);
  }
}

::grpc::ServerUnaryReactor* ToolServer::Run(::grpc::CallbackServerContext* ctx, const relay::v1::RunRequest* req, relay::v1::RunResponse* resp) {
  auto* reactor = ctx->DefaultReactor();

  try {
    auto handle = service_->Run(BearerSecret(*ctx), *req);
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
    reactor->Finish(Unauthenticated(*ctx, e));
  }

  return reactor;
}

} // namespace relay::grpc
