#include "schema.hpp"

namespace hivestate::db::sql {

void ApplySchema(SchemaExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE EXTENSION IF NOT EXISTS pgcrypto;",

      "CREATE TABLE IF NOT EXISTS agents ("
      " agent_id TEXT PRIMARY KEY,"
      " status TEXT NOT NULL DEFAULT 'idle' CHECK (status IN ('idle','busy','offline')),"
      " current_task_id TEXT,"
      " context_usage DOUBLE PRECISION NOT NULL DEFAULT 0.0,"
      " last_activity TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " capabilities JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " performance_metrics JSONB NOT NULL DEFAULT '{}'::jsonb,"
      " created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW());",

      "CREATE TABLE IF NOT EXISTS tasks ("
      " task_id TEXT PRIMARY KEY DEFAULT gen_random_uuid()::text,"
      " status TEXT NOT NULL DEFAULT 'pending'"
      "   CHECK (status IN ('pending','assigned','in_progress','completed','failed')),"
      " agent_id TEXT REFERENCES agents(agent_id) ON DELETE SET NULL,"
      " priority INTEGER NOT NULL DEFAULT 5,"
      " created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " started_at TIMESTAMPTZ,"
      " completed_at TIMESTAMPTZ,"
      " metadata JSONB NOT NULL DEFAULT '{}'::jsonb,"
      " result JSONB,"
      " updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " created_seq BIGSERIAL);",

      "CREATE TABLE IF NOT EXISTS system_snapshots ("
      " id BIGSERIAL PRIMARY KEY,"
      " timestamp TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " total_agents BIGINT NOT NULL DEFAULT 0,"
      " active_agents BIGINT NOT NULL DEFAULT 0,"
      " total_tasks BIGINT NOT NULL DEFAULT 0,"
      " completed_tasks BIGINT NOT NULL DEFAULT 0,"
      " failed_tasks BIGINT NOT NULL DEFAULT 0,"
      " average_context_usage DOUBLE PRECISION NOT NULL DEFAULT 0.0,"
      " quality_score DOUBLE PRECISION NOT NULL DEFAULT 0.0,"
      " metadata JSONB NOT NULL DEFAULT '{}'::jsonb);",

      "CREATE TABLE IF NOT EXISTS checkpoints ("
      " id BIGSERIAL PRIMARY KEY,"
      " checkpoint_name TEXT NOT NULL,"
      " timestamp TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
      " data JSONB NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_agents_status ON agents(status);",
      "CREATE INDEX IF NOT EXISTS idx_agents_last_activity ON agents(last_activity);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_priority ON tasks(priority DESC, status);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_agent_id ON tasks(agent_id);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_created_at ON tasks(created_at);",
      "CREATE INDEX IF NOT EXISTS idx_snapshots_timestamp ON system_snapshots(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_checkpoints_name ON checkpoints(checkpoint_name);",
      "CREATE INDEX IF NOT EXISTS idx_checkpoints_timestamp ON checkpoints(timestamp);",

      "CREATE OR REPLACE FUNCTION hivestate_touch_updated_at() RETURNS TRIGGER AS $$"
      " BEGIN NEW.updated_at = NOW(); RETURN NEW; END;"
      " $$ LANGUAGE plpgsql;",

      "DROP TRIGGER IF EXISTS agents_touch_updated_at ON agents;",
      "CREATE TRIGGER agents_touch_updated_at BEFORE UPDATE ON agents"
      " FOR EACH ROW EXECUTE FUNCTION hivestate_touch_updated_at();",
      "DROP TRIGGER IF EXISTS tasks_touch_updated_at ON tasks;",
      "CREATE TRIGGER tasks_touch_updated_at BEFORE UPDATE ON tasks"
      " FOR EACH ROW EXECUTE FUNCTION hivestate_touch_updated_at();",
  };
  return kSchema;
}

// Times are unix milliseconds. tasks.rowid provides insertion order.
const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS agents ("
      " agent_id TEXT PRIMARY KEY,"
      " status TEXT NOT NULL DEFAULT 'idle' CHECK (status IN ('idle','busy','offline')),"
      " current_task_id TEXT,"
      " context_usage REAL NOT NULL DEFAULT 0.0,"
      " last_activity INTEGER NOT NULL,"
      " capabilities TEXT NOT NULL DEFAULT '[]',"
      " performance_metrics TEXT NOT NULL DEFAULT '{}',"
      " created_at INTEGER NOT NULL,"
      " updated_at INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS tasks ("
      " task_id TEXT PRIMARY KEY,"
      " status TEXT NOT NULL DEFAULT 'pending'"
      "   CHECK (status IN ('pending','assigned','in_progress','completed','failed')),"
      " agent_id TEXT REFERENCES agents(agent_id) ON DELETE SET NULL,"
      " priority INTEGER NOT NULL DEFAULT 5,"
      " created_at INTEGER NOT NULL,"
      " started_at INTEGER,"
      " completed_at INTEGER,"
      " metadata TEXT NOT NULL DEFAULT '{}',"
      " result TEXT,"
      " updated_at INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS system_snapshots ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " timestamp INTEGER NOT NULL,"
      " total_agents INTEGER NOT NULL DEFAULT 0,"
      " active_agents INTEGER NOT NULL DEFAULT 0,"
      " total_tasks INTEGER NOT NULL DEFAULT 0,"
      " completed_tasks INTEGER NOT NULL DEFAULT 0,"
      " failed_tasks INTEGER NOT NULL DEFAULT 0,"
      " average_context_usage REAL NOT NULL DEFAULT 0.0,"
      " quality_score REAL NOT NULL DEFAULT 0.0,"
      " metadata TEXT NOT NULL DEFAULT '{}');",

      "CREATE TABLE IF NOT EXISTS checkpoints ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " checkpoint_name TEXT NOT NULL,"
      " timestamp INTEGER NOT NULL,"
      " data TEXT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_agents_status ON agents(status);",
      "CREATE INDEX IF NOT EXISTS idx_agents_last_activity ON agents(last_activity);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_priority ON tasks(priority DESC, status);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_agent_id ON tasks(agent_id);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_created_at ON tasks(created_at);",
      "CREATE INDEX IF NOT EXISTS idx_snapshots_timestamp ON system_snapshots(timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_checkpoints_name ON checkpoints(checkpoint_name);",
      "CREATE INDEX IF NOT EXISTS idx_checkpoints_timestamp ON checkpoints(timestamp);",
  };
  return kSchema;
}

} // namespace hivestate::db::sql
