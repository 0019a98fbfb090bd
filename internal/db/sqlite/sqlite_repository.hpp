#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
