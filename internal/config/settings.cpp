#include "settings.hpp"

#include <sstream>

namespace hivestate::config {

namespace {

template <typename T, typename D>
D OrDefault(T value, D fallback) {
  return value == 0 ? fallback : D(value);
}

// libpq quoting: wrap in single quotes, escape ' and backslash.
std::string Quote(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

std::string BuildConnInfo(const hivestate::runtime::config::PostgresConfig& config) {
  if (!config.connection_uri().empty()) {
    return config.connection_uri();
  }

  std::ostringstream out;
  out << "host=" << Quote(config.host().empty() ? "localhost" : config.host());
  out << " port=" << (config.port() == 0 ? 5432 : config.port());
  out << " dbname=" << Quote(config.database().empty() ? "hive_state" : config.database());
  out << " user=" << Quote(config.user().empty() ? "hive_user" : config.user());
  if (!config.password().empty()) {
    out << " password=" << Quote(config.password());
  }
  out << " connect_timeout=" << (config.connect_timeout_sec() == 0 ? 10 : config.connect_timeout_sec());
  out << " application_name=hivestate";
  return out.str();
}

void ApplyOverrides(hivestate::runtime::config::RuntimeConfig* config, const hivestate::runtime::config::RuntimeConfig& overrides) {
  if (overrides.persistent().has_postgres()) {
    config->mutable_persistent()->mutable_postgres()->clear_connection_uri();
  }
  config->MergeFrom(overrides);
}

PostgresSettings ResolvePostgres(const hivestate::runtime::config::PersistentConfig& config) {
  PostgresSettings s;
  const auto&      pg = config.postgres();

  s.conninfo        = BuildConnInfo(pg);
  s.min_connections = OrDefault(pg.min_connections(), s.min_connections);
  s.max_connections = OrDefault(pg.max_connections(), s.max_connections);
  if (s.min_connections > s.max_connections) {
    s.min_connections = s.max_connections;
  }
  s.acquire_timeout       = OrDefault(pg.acquire_timeout_ms(), s.acquire_timeout);
  s.command_timeout       = OrDefault(pg.command_timeout_ms(), s.command_timeout);
  s.connect_timeout       = OrDefault(pg.connect_timeout_sec(), s.connect_timeout);
  s.max_idle              = OrDefault(pg.max_idle_sec(), s.max_idle);
  s.serialization_retries = OrDefault(static_cast<int>(config.serialization_retries()), s.serialization_retries);
  return s;
}

RedisSettings ResolveRedis(const hivestate::runtime::config::RedisConfig& config) {
  RedisSettings s;
  if (!config.host().empty()) {
    s.host = config.host();
  }
  s.port                = OrDefault(static_cast<int>(config.port()), s.port);
  s.db                  = static_cast<int>(config.db());
  s.password            = config.password();
  s.pool_size           = OrDefault(config.pool_size(), s.pool_size);
  s.connect_timeout     = OrDefault(config.connect_timeout_ms(), s.connect_timeout);
  s.socket_timeout      = OrDefault(config.socket_timeout_ms(), s.socket_timeout);
  s.pool_wait_timeout   = OrDefault(config.pool_wait_timeout_ms(), s.pool_wait_timeout);
  s.connection_lifetime = OrDefault(config.connection_lifetime_sec(), s.connection_lifetime);
  return s;
}

EphemeralSettings ResolveEphemeral(const hivestate::runtime::config::EphemeralConfig& config) {
  EphemeralSettings s;
  s.default_ttl = OrDefault(config.default_ttl_sec(), s.default_ttl);
  // task entries live half as long as the default unless configured
  s.task_ttl         = config.task_ttl_sec() == 0 ? s.default_ttl / 2 : std::chrono::seconds(config.task_ttl_sec());
  s.coordination_ttl = OrDefault(config.coordination_ttl_sec(), s.coordination_ttl);
  s.session_ttl      = config.session_ttl_sec() == 0 ? s.default_ttl : std::chrono::seconds(config.session_ttl_sec());
  s.metric_ttl       = OrDefault(config.metric_ttl_sec(), s.metric_ttl);
  s.stream_maxlen    = OrDefault(config.stream_maxlen(), s.stream_maxlen);
  s.block_timeout    = OrDefault(config.block_timeout_ms(), s.block_timeout);
  return s;
}

CacheSettings ResolveCache(const hivestate::runtime::config::CacheConfig& config) {
  CacheSettings s;
  if (config.has_cache_agent_state()) {
    s.cache_agent_state = config.cache_agent_state();
  }
  if (config.has_cache_task_data()) {
    s.cache_task_data = config.cache_task_data();
  }
  s.agent_ttl        = OrDefault(config.agent_ttl_sec(), s.agent_ttl);
  s.task_ttl         = OrDefault(config.task_ttl_sec(), s.task_ttl);
  s.hit_ratio_target = config.hit_ratio_target() > 0.0 ? config.hit_ratio_target() : s.hit_ratio_target;
  return s;
}

MigrationSettings ResolveMigration(const hivestate::runtime::config::MigrationConfig& config) {
  MigrationSettings s;
  if (!config.legacy_db_path().empty()) {
    s.legacy_db_path = config.legacy_db_path();
  }
  s.batch_size              = OrDefault(config.batch_size(), s.batch_size);
  s.validation_sample_size  = OrDefault(config.validation_sample_size(), s.validation_sample_size);
  s.dry_run                 = config.dry_run();
  s.fail_fast               = config.fail_fast();
  s.snapshot_retention_days = OrDefault(static_cast<int>(config.snapshot_retention_days()), s.snapshot_retention_days);
  s.checkpoint_limit        = OrDefault(config.checkpoint_limit(), s.checkpoint_limit);
  if (config.has_rollback_enabled()) {
    s.rollback_enabled = config.rollback_enabled();
  }
  return s;
}

} // namespace hivestate::config
