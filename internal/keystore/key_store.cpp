#include "key_store.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::keystore {

using util::AuthError;

KeyStore::KeyStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds ttl, util::ClockFn clock)
    : repository_(std::move(repository)), ttl_(ttl), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("KeyStore: repository is required");
  }
}

TenantKey KeyStore::Resolve(const std::string& secret) {
  if (secret.empty()) {
    throw AuthError(AuthError::Reason::kMissingCredential, "Unauthorized: API key required");
  }

  {
    std::shared_lock lock(mutex_);
    auto             it = cache_.find(secret);
    if (it != cache_.end() && clock_() - it->second.inserted_at < ttl_) {
      return it->second.value;
    }
  }

  auto value = Load(secret);

  std::unique_lock lock(mutex_);
  cache_[secret] = CacheEntry{value, clock_()};
  return value;
}

TenantKey KeyStore::Load(const std::string& secret) {
  auto tx     = repository_->Begin();
  auto tenant = repository_->FindTenantBySecretDigest(*tx, crypto::Sha256Hex(secret));
  if (!tenant) {
    throw AuthError(AuthError::Reason::kInvalidCredential, "Unauthorized: Invalid API key");
  }

  if (tenant->encryption_key.empty()) {
    const auto generated = crypto::KeyToHex(crypto::GenerateKey());
    const auto r         = repository_->SetEncryptionKeyIfAbsent(*tx, tenant->tenant_id, generated);
    if (!r) {
      throw std::runtime_error("failed to persist encryption key: " + r.message);
    }

    tenant = repository_->GetTenant(*tx, tenant->tenant_id);
    if (!tenant || tenant->encryption_key.empty()) {
      throw std::runtime_error("encryption key missing after write");
    }

    RELAY_LOG_INFO("generated tenant encryption key", {observability::StringField("tenant_id", tenant->tenant_id)});
  }

  tx->Commit();

  TenantKey out;
  out.tenant_id     = tenant->tenant_id;
  out.resource_name = tenant->resource_name;
  out.key           = crypto::KeyFromHex(tenant->encryption_key);
  return out;
}

void KeyStore::Invalidate(const std::string& secret) {
  std::unique_lock lock(mutex_);
  cache_.erase(secret);
}

void KeyStore::Clear() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

std::size_t KeyStore::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace relay::keystore
