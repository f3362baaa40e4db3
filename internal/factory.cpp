#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/ephemeral/memory/memory_backend.hpp"
#include "internal/observability/logging.hpp"
#if HIVESTATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if HIVESTATE_EPHEMERAL_REDIS
#include "internal/ephemeral/redis/redis_backend.hpp"
#endif

namespace hivestate::factory {

using hivestate::observability::IntField;
using hivestate::observability::StringField;
using hivestate::runtime::config::EphemeralConfig;
using hivestate::runtime::config::PersistentConfig;
using hivestate::runtime::config::RuntimeConfig;

namespace {

class SqliteSchemaExecutor final : public db::sql::SchemaExecutor {
 public:
  explicit SqliteSchemaExecutor(db::sqlite::SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

#if HIVESTATE_DB_POSTGRES
// Whole schema in one transaction; a failure leaves nothing half-applied.
class PgSchemaExecutor final : public db::sql::SchemaExecutor {
 public:
  explicit PgSchemaExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const PersistentConfig& config) {
  if (config.has_sqlite()) {
    const auto& path = config.sqlite().path().empty() ? std::string("hivestate.db") : config.sqlite().path();
    auto        db   = std::make_shared<db::sqlite::SqliteDB>(path);

    SqliteSchemaExecutor executor(*db);
    db::sql::ApplySchema(executor, db::sql::SqliteSchema());

    HIVESTATE_LOG_INFO("Persistent backend ready", {StringField("backend", "sqlite"), StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(db));
  }

  if (config.has_postgres()) {
#if HIVESTATE_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(config::ResolvePostgres(config));
    try {
      pool->Warm();
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);

      PgSchemaExecutor executor(tx);
      db::sql::ApplySchema(executor, db::sql::PostgresSchema());
      tx.commit();
    } catch (const util::StoreError&) {
      throw;
    } catch (const std::exception& e) {
      throw db::postgres::TranslateError(e);
    }

    HIVESTATE_LOG_INFO("Persistent backend ready", {StringField("backend", "postgres"), StringField("database", config.postgres().database())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  HIVESTATE_LOG_INFO("Persistent backend ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<ephemeral::Backend> BuildEphemeralBackend(const EphemeralConfig& config) {
  if (config.has_redis()) {
#if HIVESTATE_EPHEMERAL_REDIS
    return std::make_shared<ephemeral::redis::RedisBackend>(config::ResolveRedis(config.redis()));
#else
    throw std::runtime_error("redis backend requested but not enabled at build time");
#endif
  }
  if (config.has_memory()) {
    HIVESTATE_LOG_INFO("Ephemeral backend ready", {StringField("backend", "memory")});
    return std::make_shared<ephemeral::memory::MemoryBackend>();
  }
  return nullptr;
}

} // namespace

Runtime Build(const RuntimeConfig& config) {
  Runtime runtime;

  const auto ephemeral_settings = config::ResolveEphemeral(config.ephemeral());
  const auto cache_settings     = config::ResolveCache(config.cache());

  // ------------------------------------------------------------------
  // Persistent layer
  // ------------------------------------------------------------------
  auto repository    = BuildRepository(config.persistent());
  const int retries  = config.persistent().serialization_retries() ? static_cast<int>(config.persistent().serialization_retries()) : 3;
  runtime.persistent = std::make_shared<persistent::PersistentStore>(std::move(repository), retries);

  // ------------------------------------------------------------------
  // Ephemeral layer (optional)
  // ------------------------------------------------------------------
  if (auto backend = BuildEphemeralBackend(config.ephemeral())) {
    runtime.ephemeral = std::make_shared<ephemeral::EphemeralStore>(std::move(backend), ephemeral_settings);
  } else {
    HIVESTATE_LOG_WARN("No ephemeral backend configured; ephemeral operations are unavailable");
  }

  // ------------------------------------------------------------------
  // Routing + front door
  // ------------------------------------------------------------------
  runtime.policy       = std::make_shared<const policy::DistributionPolicy>(ephemeral_settings, cache_settings);
  runtime.orchestrator = std::make_shared<orchestrator::HybridOrchestrator>(runtime.persistent, runtime.ephemeral, runtime.policy,
                                                                            cache_settings.hit_ratio_target);

  HIVESTATE_LOG_INFO("Hybrid state layer built", {StringField("ephemeral", runtime.ephemeral ? "enabled" : "disabled"),
                                                  IntField("serialization_retries", retries)});
  return runtime;
}

std::unique_ptr<migration::Migrator> BuildMigrator(const RuntimeConfig& config, const Runtime& runtime) {
  if (!runtime.orchestrator) {
    throw std::invalid_argument("BuildMigrator: runtime has no orchestrator");
  }
  return std::make_unique<migration::Migrator>(config::ResolveMigration(config.migration()), runtime.orchestrator);
}

} // namespace hivestate::factory
