#pragma once

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/crypto/cipher_service.hpp"
#include "internal/util/time.hpp"

namespace relay::db {
class Repository;
}

namespace relay::keystore {

struct TenantKey {
  std::string tenant_id;
  std::string resource_name;
  crypto::Key key{};
};

/*
  Resolves a tenant secret to {tenant, resource, key}.

  CRITICAL GUARANTEES:

  - Cache entries expire a fixed TTL after insertion; hits never extend it.
  - A miss performs exactly one repository transaction.
  - A missing key is generated once per tenant: the conditional write
    runs inside the lookup transaction and the stored key is re-read,
    so concurrent misses converge on the same key.
  - Repository failures propagate; nothing is retried here.
*/
class KeyStore {
 public:
  static constexpr std::chrono::seconds kDefaultTtl{300};

  KeyStore(std::shared_ptr<db::Repository> repository,
           std::chrono::milliseconds       ttl   = kDefaultTtl,
           util::ClockFn                   clock = util::Now);

  // Throws util::AuthError.
  TenantKey Resolve(const std::string& secret);

  void        Invalidate(const std::string& secret);
  void        Clear();
  std::size_t Size() const;

 private:
  struct CacheEntry {
    TenantKey       value;
    util::TimePoint inserted_at;
  };

  TenantKey Load(const std::string& secret);

  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       ttl_;
  util::ClockFn                   clock_;

  mutable std::shared_mutex                   mutex_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

} // namespace relay::keystore
