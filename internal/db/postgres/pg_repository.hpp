#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relay::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

}
