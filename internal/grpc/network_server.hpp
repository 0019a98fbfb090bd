#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/services/v1/network_service.grpc.pb.h"
#include "internal/service/network_service.hpp"

namespace relay::grpc {

class NetworkServer final : public relay::services::v1::NetworkService::Service {
public:
  explicit NetworkServer(std::shared_ptr<relay::service::NetworkService> svc);

  ::grpc::Status Allocate(::grpc::ServerContext*, const relay::network::v1::TenantNetworkRequest*,
                          relay::network::v1::NetworkAllocation*) override;
  ::grpc::Status AttachRelay(::grpc::ServerContext*, const relay::network::v1::TenantNetworkRequest*,
                             relay::network::v1::NetworkAllocation*) override;
  ::grpc::Status Release(::grpc::ServerContext*, const relay::network::v1::TenantNetworkRequest*,
                         relay::network::v1::NetworkAllocation*) override;
  ::grpc::Status ConfirmTeardown(::grpc::ServerContext*, const relay::network::v1::TenantNetworkRequest*,
                                 relay::network::v1::NetworkAllocation*) override;
  ::grpc::Status GetAllocation(::grpc::ServerContext*, const relay::network::v1::TenantNetworkRequest*,
                               relay::network::v1::NetworkAllocation*) override;
  ::grpc::Status ListAllocations(::grpc::ServerContext*, const relay::network::v1::ListAllocationsRequest*,
                                 relay::network::v1::ListAllocationsResponse*) override;

private:
  std::shared_ptr<relay::service::NetworkService> service_;
};

} // namespace relay::grpc
