#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "relay/v1.hpp"

namespace relay::grpc {

AdminServer::AdminServer(std::shared_ptr<relay::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const relay::v1::StatsRequest* req, relay::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::CreateTenant(::grpc::ServerContext*, const relay::v1::CreateTenantRequest* req,
                                         relay::v1::CreateTenantResponse* resp) {
  try {
    *resp = service_->CreateTenant(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::InvalidateCredential(::grpc::ServerContext*, const relay::v1::InvalidateCredentialRequest* req,
                                                 relay::v1::InvalidateCredentialResponse* resp) {
  try {
    *resp = service_->InvalidateCredential(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
