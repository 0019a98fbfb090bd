#include <assert.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/crypto/cipher_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using relay::db::Repository;
using relay::db::Result;
using relay::db::Transaction;
using relay::db::memory::MemoryRepository;
using relay::db::model::NetworkAllocationRecord;
using relay::db::model::TenantRecord;
using relay::keystore::KeyStore;
using relay::util::AuthError;

// Counts credential lookups; everything else goes straight through.
class HookedRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertTenant(Transaction& tx, const TenantRecord& record) override {
    return inner_.InsertTenant(tx, record);
  }

  std::optional<TenantRecord> GetTenant(Transaction& tx, const std::string& id) override {
    return inner_.GetTenant(tx, id);
  }

  std::optional<TenantRecord> FindTenantBySecretDigest(Transaction& tx, const std::string& digest) override {
    ++digest_lookups;
    return inner_.FindTenantBySecretDigest(tx, digest);
  }

  std::vector<TenantRecord> ListTenants(Transaction& tx) override {
    return inner_.ListTenants(tx);
  }

  Result SetEncryptionKeyIfAbsent(Transaction& tx, const std::string& tenant_id, const std::string& key_hex) override {
    ++key_writes;
    return inner_.SetEncryptionKeyIfAbsent(tx, tenant_id, key_hex);
  }

  Result InsertNetwork(Transaction& tx, const NetworkAllocationRecord& record) override {
    return inner_.InsertNetwork(tx, record);
  }

  std::optional<NetworkAllocationRecord> GetNetwork(Transaction& tx, const std::string& id) override {
    return inner_.GetNetwork(tx, id);
  }

  std::vector<NetworkAllocationRecord> ListNetworks(Transaction& tx) override {
    return inner_.ListNetworks(tx);
  }

  Result UpdateNetwork(Transaction& tx, const NetworkAllocationRecord& record) override {
    return inner_.UpdateNetwork(tx, record);
  }

  Result DeleteNetwork(Transaction& tx, const std::string& id) override {
    return inner_.DeleteNetwork(tx, id);
  }

  std::atomic<int> digest_lookups{0};
  std::atomic<int> key_writes{0};

 private:
  MemoryRepository inner_;
};

struct FakeClock {
  relay::util::TimePoint now = relay::util::TimePoint{} + std::chrono::hours(1);

  relay::util::ClockFn Fn() {
    return [this] { return now; };
  }
};

void SeedTenant(Repository& repo, const std::string& tenant_id, const std::string& secret) {
  TenantRecord record;
  record.tenant_id     = tenant_id;
  record.name          = tenant_id;
  record.secret_digest = relay::crypto::Sha256Hex(secret);
  record.resource_name = tenant_id + "-vm";

  auto tx = repo.Begin();
  assert(repo.InsertTenant(*tx, record));
  tx->Commit();
}

std::string StoredKey(Repository& repo, const std::string& tenant_id) {
  auto tx     = repo.Begin();
  auto tenant = repo.GetTenant(*tx, tenant_id);
  tx->Commit();
  assert(tenant.has_value());
  return tenant->encryption_key;
}

void TestRepeatedResolveInsideTtlHitsCache() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");

  FakeClock clock;
  KeyStore  store(repo, std::chrono::minutes(5), clock.Fn());

  const auto first = store.Resolve("secret-a");
  clock.now += std::chrono::minutes(4);
  const auto second = store.Resolve("secret-a");

  assert(first.tenant_id == "tenant-a");
  assert(first.resource_name == "tenant-a-vm");
  assert(first.key == second.key);
  assert(repo->digest_lookups == 1);
  assert(repo->key_writes == 1);

  // The generated key was persisted.
  assert(StoredKey(*repo, "tenant-a") == relay::crypto::KeyToHex(first.key));
}

void TestExpiryTriggersOneFreshLookup() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");

  FakeClock clock;
  KeyStore  store(repo, std::chrono::minutes(5), clock.Fn());

  const auto first = store.Resolve("secret-a");

  // Hits never extend the TTL.
  clock.now += std::chrono::minutes(3);
  (void)store.Resolve("secret-a");
  clock.now += std::chrono::minutes(3);

  const auto refreshed = store.Resolve("secret-a");
  assert(repo->digest_lookups == 2);
  assert(refreshed.key == first.key);

  // No second key was generated for the tenant.
  assert(repo->key_writes == 1);
}

void TestMissingAndInvalidCredentials() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");

  KeyStore store(repo);

  bool missing = false;
  try {
    (void)store.Resolve("");
  } catch (const AuthError& e) {
    missing = e.reason() == AuthError::Reason::kMissingCredential;
    assert(std::string(e.what()) == "Unauthorized: API key required");
  }
  assert(missing);
  assert(repo->digest_lookups == 0);

  for (int i = 0; i < 2; ++i) {
    bool invalid = false;
    try {
      (void)store.Resolve("not-a-secret");
    } catch (const AuthError& e) {
      invalid = e.reason() == AuthError::Reason::kInvalidCredential;
      assert(std::string(e.what()) == "Unauthorized: Invalid API key");
    }
    assert(invalid);
  }

  // Failures are not cached.
  assert(repo->digest_lookups == 2);
  assert(store.Size() == 0);
}

void TestInvalidateForcesReload() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");
  SeedTenant(*repo, "tenant-b", "secret-b");

  KeyStore store(repo);
  (void)store.Resolve("secret-a");
  (void)store.Resolve("secret-b");
  assert(store.Size() == 2);

  store.Invalidate("secret-a");
  assert(store.Size() == 1);
  (void)store.Resolve("secret-a");
  assert(repo->digest_lookups == 3);

  store.Clear();
  assert(store.Size() == 0);
}

void TestDistinctTenantsGetDistinctKeys() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");
  SeedTenant(*repo, "tenant-b", "secret-b");

  KeyStore store(repo);
  assert(store.Resolve("secret-a").key != store.Resolve("secret-b").key);
}

void TestConcurrentFirstResolutionConvergesOnOneKey() {
  auto repo = std::make_shared<HookedRepository>();
  SeedTenant(*repo, "tenant-a", "secret-a");

  // Separate stores so no cache is shared; only persistence can serialize them.
  constexpr int                          kThreads = 8;
  std::vector<std::unique_ptr<KeyStore>> stores;
  for (int i = 0; i < kThreads; ++i) stores.push_back(std::make_unique<KeyStore>(repo));

  std::vector<relay::crypto::Key> keys(kThreads);
  std::vector<std::thread>        threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { keys[i] = stores[i]->Resolve("secret-a").key; });
  }
  for (auto& t : threads) t.join();

  std::set<relay::crypto::Key> distinct(keys.begin(), keys.end());
  assert(distinct.size() == 1);
  assert(StoredKey(*repo, "tenant-a") == relay::crypto::KeyToHex(keys[0]));
}

} // namespace

int main() {
  TestRepeatedResolveInsideTtlHitsCache();
  TestExpiryTriggersOneFreshLookup();
  TestMissingAndInvalidCredentials();
  TestInvalidateForcesReload();
  TestDistinctTenantsGetDistinctKeys();
  TestConcurrentFirstResolutionConvergesOnOneKey();

  std::cout << "relay_unit_key_store: pass\n";
  return 0;
}
