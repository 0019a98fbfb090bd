#include "admin_service.hpp"

#include <stdexcept>

#include "internal/agent/agent_registry.hpp"
#include "internal/crypto/cipher_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace relay::service {

using namespace relay::v1;
using relay::observability::StringField;

namespace {

constexpr std::size_t kSecretBytes = 32;

void ThrowIfDbError(const relay::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == relay::db::ErrorCode::ConstraintViolation || result.code == relay::db::ErrorCode::AlreadyExists) {
    throw util::AlreadyExists(prefix + ": " + result.message);
  }
  throw std::runtime_error(prefix + ": " + result.message);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  try {
    StatsResponse resp;
    resp.set_agents_connected(ctx_.agents->Size());
    resp.set_commands_pending(ctx_.dispatcher->PendingCount());

    const auto counters = ctx_.dispatcher->Stats();
    resp.set_commands_completed(counters.completed);
    resp.set_commands_failed(counters.failed);
    resp.set_commands_timed_out(counters.timed_out);

    resp.set_credentials_cached(ctx_.key_store->Size());

    auto       tx       = ctx_.repository->Begin();
    const auto networks = ctx_.repository->ListNetworks(*tx);
    tx->Commit();
    resp.set_networks_allocated(networks.size());

    return resp;
  } catch (const std::exception& ex) {
    RELAY_LOG_ERROR("RPC failed", {StringField("route", "AdminService.Stats"), StringField("error", ex.what())});
    throw;
  }
}

CreateTenantResponse AdminService::CreateTenant(const CreateTenantRequest& req) {
  if (req.name().empty()) {
    throw util::InvalidArgument("tenant name is required");
  }

  const auto secret = util::ToHex(crypto::RandomBytes(kSecretBytes));

  relay::db::model::TenantRecord record;
  record.tenant_id     = util::NewUUIDString();
  record.name          = req.name();
  record.secret_digest = crypto::Sha256Hex(secret);
  record.resource_name = req.resource_name().empty() ? req.name() : req.resource_name();
  record.created_at_ms = util::ToUnixMillis(util::Now());

  auto tx = ctx_.repository->Begin();
  ThrowIfDbError(ctx_.repository->InsertTenant(*tx, record), "insert tenant");
  tx->Commit();

  RELAY_LOG_INFO("tenant created", {StringField("tenant_id", record.tenant_id), StringField("name", record.name)});

  CreateTenantResponse resp;
  resp.set_tenant_id(record.tenant_id);
  resp.set_secret(secret);
  return resp;
}

InvalidateCredentialResponse AdminService::InvalidateCredential(const InvalidateCredentialRequest& req) {
  if (req.secret().empty()) {
    ctx_.key_store->Clear();
    RELAY_LOG_INFO("credential cache cleared");
  } else {
    ctx_.key_store->Invalidate(req.secret());
  }
  return {};
}

} // namespace relay::service
