#pragma once

#include <cstdint>
#include <string>

namespace hivestate::db::model {

struct SnapshotRecord {
  uint64_t id           = 0;
  uint64_t timestamp_ms = 0;

  int64_t total_agents    = 0;
  int64_t active_agents   = 0;
  int64_t total_tasks     = 0;
  int64_t completed_tasks = 0;
  int64_t failed_tasks    = 0;

  double average_context_usage = 0.0;
  double quality_score         = 0.0;

  std::string metadata_json = "{}";
};

} // namespace hivestate::db::model
