#include "pg_pool.hpp"

namespace relay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_tenant_by_digest",
               "SELECT tenant_id, name, secret_digest, resource_name, encryption_key, created_at_ms "
               "FROM tenants WHERE secret_digest=$1 LIMIT 1");

  conn.prepare("get_tenant",
               "SELECT tenant_id, name, secret_digest, resource_name, encryption_key, created_at_ms "
               "FROM tenants WHERE tenant_id=$1");

  conn.prepare("set_key_if_absent",
               "UPDATE tenants SET encryption_key=$2 WHERE tenant_id=$1 AND encryption_key IS NULL");

  conn.prepare("get_network",
               "SELECT tenant_id, network_name, block_index, subnet_cidr, gateway_address, vm_address, "
               "file_share_address, relay_address, relay_attached, state, created_at_ms "
               "FROM tenant_networks WHERE tenant_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relay::db::postgres
