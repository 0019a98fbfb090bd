#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relay/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace relay::grpc {

class AdminServer final : public relay::services::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<relay::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const relay::admin::v1::StatsRequest*,
                       relay::admin::v1::StatsResponse*) override;

  ::grpc::Status CreateTenant(::grpc::ServerContext*,
                              const relay::admin::v1::CreateTenantRequest*,
                              relay::admin::v1::CreateTenantResponse*) override;

  ::grpc::Status InvalidateCredential(::grpc::ServerContext*,
                                      const relay::admin::v1::InvalidateCredentialRequest*,
                                      relay::admin::v1::InvalidateCredentialResponse*) override;

private:
  std::shared_ptr<relay::service::AdminService> service_;
};

} // namespace relay::grpc
