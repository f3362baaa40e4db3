#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "hivestate/state/v1/state.pb.h"

namespace hivestate::db::model {

struct TaskRecord {
  std::string task_id; // empty on insert = store generates

  hivestate::state::v1::TaskStatus status = hivestate::state::v1::TASK_STATUS_PENDING;

  std::string agent_id; // empty = unassigned
  int32_t     priority = 5;

  uint64_t created_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  std::string metadata_json = "{}";
  std::string result_json; // empty = no result

  // Insertion order, breaks ties between equal created_at values.
  uint64_t created_seq = 0;
};

/*
  Conditional status change. Applied only when the stored status is one of
  `from`; the row is otherwise left untouched and Conflict is returned.
*/
struct TaskTransition {
  std::string task_id;

  hivestate::state::v1::TaskStatus from_a = hivestate::state::v1::TASK_STATUS_UNSPECIFIED;
  hivestate::state::v1::TaskStatus from_b = hivestate::state::v1::TASK_STATUS_UNSPECIFIED;
  hivestate::state::v1::TaskStatus to     = hivestate::state::v1::TASK_STATUS_UNSPECIFIED;

  std::optional<std::string> result_json;
  bool                       set_completed_at = false;

  uint64_t at_ms = 0;
};

} // namespace hivestate::db::model
