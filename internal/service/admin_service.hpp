#pragma once

#include "relay/v1.hpp"
#include "service_context.hpp"

namespace relay::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  relay::v1::StatsResponse Stats(const relay::v1::StatsRequest& req);

  // The raw secret is returned once and never stored.
  relay::v1::CreateTenantResponse CreateTenant(const relay::v1::CreateTenantRequest& req);

  relay::v1::InvalidateCredentialResponse InvalidateCredential(const relay::v1::InvalidateCredentialRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace relay::service
