#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace hivestate::config {

/*
  Resolved settings.

  proto3 scalars cannot tell "unset" from zero, so every zero in the
  RuntimeConfig is replaced by the default documented here.
*/

struct PostgresSettings {
  std::string               conninfo;
  std::size_t               min_connections    = 5;
  std::size_t               max_connections    = 20;
  std::chrono::milliseconds acquire_timeout    = std::chrono::milliseconds(5000);
  std::chrono::milliseconds command_timeout    = std::chrono::milliseconds(10000);
  std::chrono::seconds      connect_timeout    = std::chrono::seconds(10);
  std::chrono::seconds      max_idle           = std::chrono::seconds(300);
  int                       serialization_retries = 3;
};

struct RedisSettings {
  std::string               host                = "127.0.0.1";
  int                       port                = 6379;
  int                       db                  = 0;
  std::string               password;
  std::size_t               pool_size           = 20;
  std::chrono::milliseconds connect_timeout     = std::chrono::milliseconds(5000);
  std::chrono::milliseconds socket_timeout      = std::chrono::milliseconds(5000);
  std::chrono::milliseconds pool_wait_timeout   = std::chrono::milliseconds(5000);
  std::chrono::seconds      connection_lifetime = std::chrono::seconds(0);
};

struct EphemeralSettings {
  std::chrono::seconds      default_ttl      = std::chrono::seconds(3600);
  std::chrono::seconds      task_ttl         = std::chrono::seconds(1800);
  std::chrono::seconds      coordination_ttl = std::chrono::seconds(300);
  std::chrono::seconds      session_ttl      = std::chrono::seconds(3600);
  std::chrono::seconds      metric_ttl       = std::chrono::seconds(86400);
  std::size_t               stream_maxlen    = 10000;
  std::chrono::milliseconds block_timeout    = std::chrono::milliseconds(1000);
};

struct CacheSettings {
  bool                 cache_agent_state = true;
  bool                 cache_task_data   = true;
  std::chrono::seconds agent_ttl         = std::chrono::seconds(3600);
  std::chrono::seconds task_ttl          = std::chrono::seconds(1800);
  double               hit_ratio_target  = 0.95;
};

struct MigrationSettings {
  std::string legacy_db_path          = "hive_state.db";
  std::size_t batch_size              = 1000;
  std::size_t validation_sample_size  = 100;
  bool        dry_run                 = false;
  bool        fail_fast               = false;
  int         snapshot_retention_days = 30;
  std::size_t checkpoint_limit        = 100;
  bool        rollback_enabled        = true;
};

PostgresSettings  ResolvePostgres(const hivestate::runtime::config::PersistentConfig& config);
RedisSettings     ResolveRedis(const hivestate::runtime::config::RedisConfig& config);
EphemeralSettings ResolveEphemeral(const hivestate::runtime::config::EphemeralConfig& config);
CacheSettings     ResolveCache(const hivestate::runtime::config::CacheConfig& config);
MigrationSettings ResolveMigration(const hivestate::runtime::config::MigrationConfig& config);

// libpq keyword/value string built from the discrete fields.
std::string BuildConnInfo(const hivestate::runtime::config::PostgresConfig& config);

// Merges command-line overrides into a loaded config. Any postgres
// override clears a configured connection_uri so the discrete fields apply.
void ApplyOverrides(hivestate::runtime::config::RuntimeConfig* config, const hivestate::runtime::config::RuntimeConfig& overrides);

} // namespace hivestate::config
