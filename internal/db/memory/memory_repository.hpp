#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTenant(Transaction&, const model::TenantRecord&) override;
  std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string&) override;
  std::optional<model::TenantRecord> FindTenantBySecretDigest(Transaction&, const std::string&) override;
  std::vector<model::TenantRecord> ListTenants(Transaction&) override;
  Result SetEncryptionKeyIfAbsent(Transaction&, const std::string& tenant_id, const std::string& key_hex) override;

  Result InsertNetwork(Transaction&, const model::NetworkAllocationRecord&) override;
  std::optional<model::NetworkAllocationRecord> GetNetwork(Transaction&, const std::string&) override;
  std::vector<model::NetworkAllocationRecord> ListNetworks(Transaction&) override;
  Result UpdateNetwork(Transaction&, const model::NetworkAllocationRecord&) override;
  Result DeleteNetwork(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::TenantRecord> tenants;
    std::unordered_map<std::string, std::string> tenant_by_digest;
    std::map<std::string, model::NetworkAllocationRecord> networks;
  };

  // Held by a transaction for its whole lifetime.
  std::mutex writer_mutex_;

  std::mutex state_mutex_;
  State committed_;
};

}
