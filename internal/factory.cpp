#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/agent/agent_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/agent_gateway_server.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/network_server.hpp"
#include "internal/grpc/tool_server.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/network/docker_cli_driver.hpp"
#include "internal/network/memory_network_driver.hpp"
#include "internal/network/network_allocator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payload/payload_builder.hpp"
#include "internal/payload/script_catalog.hpp"
#include "internal/payload/tool_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/network_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tool_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/timer_queue.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELAY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relay::factory {

using relay::observability::StringField;

namespace {

#if RELAY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS tenants (tenant_id TEXT PRIMARY KEY, name TEXT NOT NULL, secret_digest TEXT UNIQUE, resource_name TEXT NOT NULL, encryption_key TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS tenant_networks (tenant_id TEXT PRIMARY KEY, network_name TEXT NOT NULL, block_index INTEGER NOT NULL UNIQUE, subnet_cidr TEXT NOT NULL, gateway_address TEXT NOT NULL, vm_address TEXT NOT NULL, file_share_address TEXT NOT NULL, relay_address TEXT NOT NULL, relay_attached INTEGER NOT NULL, state INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms FROM tenants LIMIT 1;");
  sqlite_db->Exec("SELECT tenant_id,network_name,block_index,subnet_cidr,relay_attached,state FROM tenant_networks LIMIT 1;");
}
#endif

#if RELAY_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS tenants (tenant_id TEXT PRIMARY KEY, name TEXT NOT NULL, secret_digest TEXT UNIQUE, resource_name TEXT NOT NULL, encryption_key TEXT, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS tenant_networks (tenant_id TEXT PRIMARY KEY, network_name TEXT NOT NULL, block_index BIGINT NOT NULL UNIQUE, subnet_cidr TEXT NOT NULL, gateway_address TEXT NOT NULL, vm_address TEXT NOT NULL, file_share_address TEXT NOT NULL, relay_address TEXT NOT NULL, relay_attached BOOLEAN NOT NULL, state SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL);");

  tx.exec("SELECT tenant_id,name,secret_digest,resource_name,encryption_key,created_at_ms FROM tenants LIMIT 1;");
  tx.exec("SELECT tenant_id,network_name,block_index,subnet_cidr,relay_attached,state FROM tenant_networks LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<network::NetworkDriver> BuildNetworkDriver(const relay::runtime::config::NetworkConfig& config) {
  if (config.driver() == "docker") {
    return std::make_shared<network::DockerCliDriver>(config.docker_binary());
  }
  if (config.driver() == "memory") {
    return std::make_shared<network::MemoryNetworkDriver>();
  }
  throw util::InvalidArgument("unknown network driver: " + config.driver());
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELAY_LOG_WARN("no database configured, tenants live in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and credentials
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto key_store  = std::make_shared<keystore::KeyStore>(
      repository, util::ToMillis(config.keystore().cache_ttl(), keystore::KeyStore::kDefaultTtl));

  // ------------------------------------------------------------------
  // Payloads
  // ------------------------------------------------------------------
  auto catalog = std::make_shared<payload::ScriptCatalog>(config.scripts().catalog_dir());
  auto tools   = std::make_shared<payload::ToolRegistry>();
  auto builder = std::make_shared<payload::PayloadBuilder>(catalog);

  // ------------------------------------------------------------------
  // Agents and dispatch
  // ------------------------------------------------------------------
  app.timers = std::make_shared<util::TimerQueue>();
  app.timers->Start();

  app.agents     = std::make_shared<agent::AgentRegistry>();
  app.dispatcher = std::make_shared<dispatch::CommandDispatcher>(
      app.agents, app.timers,
      util::ToMillis(config.dispatcher().command_timeout(), dispatch::CommandDispatcher::kDefaultTimeout));

  // ------------------------------------------------------------------
  // Networks
  // ------------------------------------------------------------------
  network::NetworkOptions net_options;
  net_options.pools.assign(config.network().pools().begin(), config.network().pools().end());
  net_options.control_plane_cidrs.assign(config.network().control_plane_cidrs().begin(), config.network().control_plane_cidrs().end());
  net_options.relay_container = config.network().relay_container();

  auto allocator = std::make_shared<network::NetworkAllocator>(repository, BuildNetworkDriver(config.network()), std::move(net_options));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.key_store  = key_store;
  ctx.tools      = tools;
  ctx.builder    = builder;
  ctx.agents     = app.agents;
  ctx.dispatcher = app.dispatcher;
  ctx.networks   = allocator;

  auto tool_service     = std::make_shared<service::ToolService>(ctx);
  auto dispatch_service = std::make_shared<service::DispatchService>(ctx);
  auto network_service  = std::make_shared<service::NetworkService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ToolServer>(tool_service));
  app.grpc_services.push_back(std::make_unique<grpc::AgentGatewayServer>(app.agents, key_store, config.agents().require_credential()));
  app.grpc_services.push_back(std::make_unique<grpc::DispatchServer>(dispatch_service));
  app.grpc_services.push_back(std::make_unique<grpc::NetworkServer>(network_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  RELAY_LOG_INFO("relay assembled", {StringField("scripts", config.scripts().catalog_dir()),
                                     StringField("network_driver", config.network().driver())});
  return app;
}

void Application::Shutdown() {
  if (timers) timers->Stop();
  if (dispatcher) dispatcher->Shutdown();
}

}
