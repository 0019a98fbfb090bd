#pragma once

#include "relay/v1.hpp"
#include "service_context.hpp"

namespace relay::service {

class NetworkService {
public:
  explicit NetworkService(ServiceContext ctx);

  relay::v1::NetworkAllocation Allocate(const relay::v1::TenantNetworkRequest& req);
  relay::v1::NetworkAllocation AttachRelay(const relay::v1::TenantNetworkRequest& req);
  relay::v1::NetworkAllocation Release(const relay::v1::TenantNetworkRequest& req);
  relay::v1::NetworkAllocation ConfirmTeardown(const relay::v1::TenantNetworkRequest& req);
  relay::v1::NetworkAllocation GetAllocation(const relay::v1::TenantNetworkRequest& req);

  relay::v1::ListAllocationsResponse ListAllocations();

private:
  ServiceContext ctx_;
};

} // namespace relay::service
