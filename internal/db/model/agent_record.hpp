#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "hivestate/state/v1/state.pb.h"

namespace hivestate::db::model {

/*
  Persistent agent row.

  capabilities_json is a JSON array of strings, performance_metrics_json a
  JSON object of numbers. Both are opaque documents at this layer.
*/
struct AgentRecord {
  std::string agent_id;

  hivestate::state::v1::AgentStatus status = hivestate::state::v1::AGENT_STATUS_IDLE;

  std::string current_task_id; // empty = none
  double      context_usage = 0.0;

  uint64_t last_activity_ms = 0;

  std::string capabilities_json        = "[]";
  std::string performance_metrics_json = "{}";

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

/*
  Coalesce-style partial update. Unset members keep the stored value;
  last_activity is always bumped to at_ms.
*/
struct AgentPatch {
  std::string agent_id;

  std::optional<hivestate::state::v1::AgentStatus> status;
  std::optional<std::string>                       current_task_id;
  bool                                             clear_current_task = false;
  std::optional<double>                            context_usage;
  std::optional<std::string>                       performance_metrics_json;

  uint64_t at_ms = 0;
};

} // namespace hivestate::db::model
