#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace hivestate::migration {

/*
  Rows of the single-file SQLite store being retired.

  Columns are kept as text exactly as stored; conversion (status names,
  JSON documents, timestamps) happens in the migrator so a bad row can be
  reported on its own.
*/

struct LegacyAgent {
  std::string           agent_id;
  std::string           status;
  std::string           current_task_id;
  std::optional<double> context_usage;
  std::string           last_activity;
  std::string           capabilities;
  std::string           performance_metrics;
};

struct LegacyTask {
  std::string            task_id;
  std::string            status;
  std::string            agent_id;
  std::optional<int32_t> priority;
  std::string            created_at;
  std::string            started_at;
  std::string            completed_at;
  std::string            metadata;
};

struct LegacySnapshot {
  std::string timestamp;
  int64_t     total_agents          = 0;
  int64_t     active_agents         = 0;
  int64_t     total_tasks           = 0;
  int64_t     completed_tasks       = 0;
  int64_t     failed_tasks          = 0;
  double      average_context_usage = 0.0;
  double      quality_score         = 0.0;
};

struct LegacyCheckpoint {
  std::string name;
  std::string timestamp;
  std::string data;
};

// Read-only view over the legacy database file. Throws util::StoreError.
class LegacyDatabase {
 public:
  static constexpr const char* kRequiredTables[] = {"agents", "tasks", "system_snapshots", "checkpoints"};

  explicit LegacyDatabase(const std::string& path);

  std::vector<std::string> Tables();

  // table must be one of kRequiredTables.
  uint64_t Count(const std::string& table);

  // Stable rowid order, so LIMIT/OFFSET pages do not overlap.
  std::vector<LegacyAgent> Agents(uint64_t limit, uint64_t offset);
  std::vector<LegacyTask>  Tasks(uint64_t limit, uint64_t offset);

  std::vector<LegacySnapshot>   Snapshots();
  // Newest first.
  std::vector<LegacyCheckpoint> RecentCheckpoints(uint64_t limit);

 private:
  std::unique_ptr<db::sqlite::SqliteDB> db_;
};

/*
  Legacy timestamp text to unix milliseconds.

  Accepts epoch seconds (integer or fractional) and ISO-8601
  "YYYY-MM-DD[ T]HH:MM:SS[.ffffff][Z|+HH:MM|-HH:MM]", read as UTC when
  no offset is given. Empty text is unset (0). Returns false on anything
  else.
*/
bool ParseLegacyTime(const std::string& text, uint64_t* unix_ms);

} // namespace hivestate::migration
