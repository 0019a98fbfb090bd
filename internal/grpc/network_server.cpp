#include "network_server.hpp"

#include "grpc_error.hpp"
#include "relay/v1.hpp"

namespace relay::grpc {

using relay::v1::NetworkAllocation;
using relay::v1::TenantNetworkRequest;

NetworkServer::NetworkServer(std::shared_ptr<relay::service::NetworkService> svc) : service_(std::move(svc)) {
}

::grpc::Status NetworkServer::Allocate(::grpc::ServerContext*, const TenantNetworkRequest* req, NetworkAllocation* resp) {
  try {
    *resp = service_->Allocate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkServer::AttachRelay(::grpc::ServerContext*, const TenantNetworkRequest* req, NetworkAllocation* resp) {
  try {
    *resp = service_->AttachRelay(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkServer::Release(::grpc::ServerContext*, const TenantNetworkRequest* req, NetworkAllocation* resp) {
  try {
    *resp = service_->Release(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkServer::ConfirmTeardown(::grpc::ServerContext*, const TenantNetworkRequest* req, NetworkAllocation* resp) {
  try {
    *resp = service_->ConfirmTeardown(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkServer::GetAllocation(::grpc::ServerContext*, const TenantNetworkRequest* req, NetworkAllocation* resp) {
  try {
    *resp = service_->GetAllocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NetworkServer::ListAllocations(::grpc::ServerContext*, const relay::v1::ListAllocationsRequest*,
                                              relay::v1::ListAllocationsResponse* resp) {
  try {
    *resp = service_->ListAllocations();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
