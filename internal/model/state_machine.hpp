#pragma once

#include <optional>
#include <string_view>

#include "hivestate/state/v1/state.pb.h"

namespace hivestate::model {

using hivestate::state::v1::AgentStatus;
using hivestate::state::v1::TaskStatus;

constexpr bool IsTerminal(TaskStatus status) {
  return status == hivestate::state::v1::TASK_STATUS_COMPLETED || status == hivestate::state::v1::TASK_STATUS_FAILED;
}

/*
  Task lifecycle:

    pending -> assigned -> (in_progress) -> completed | failed

  Assignment may skip in_progress and finish directly.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  using namespace hivestate::state::v1;

  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case TASK_STATUS_ASSIGNED:
      return from == TASK_STATUS_PENDING;
    case TASK_STATUS_IN_PROGRESS:
      return from == TASK_STATUS_ASSIGNED;
    case TASK_STATUS_COMPLETED:
    case TASK_STATUS_FAILED:
      return from == TASK_STATUS_ASSIGNED || from == TASK_STATUS_IN_PROGRESS;
    default:
      return false;
  }
}

// Stored text form: "idle", "busy", "offline".
constexpr std::string_view AgentStatusName(AgentStatus status) {
  using namespace hivestate::state::v1;
  switch (status) {
    case AGENT_STATUS_IDLE:
      return "idle";
    case AGENT_STATUS_BUSY:
      return "busy";
    case AGENT_STATUS_OFFLINE:
      return "offline";
    default:
      return "";
  }
}

constexpr std::optional<AgentStatus> ParseAgentStatus(std::string_view name) {
  using namespace hivestate::state::v1;
  if (name == "idle") return AGENT_STATUS_IDLE;
  if (name == "busy") return AGENT_STATUS_BUSY;
  if (name == "offline") return AGENT_STATUS_OFFLINE;
  return std::nullopt;
}

constexpr std::string_view TaskStatusName(TaskStatus status) {
  using namespace hivestate::state::v1;
  switch (status) {
    case TASK_STATUS_PENDING:
      return "pending";
    case TASK_STATUS_ASSIGNED:
      return "assigned";
    case TASK_STATUS_IN_PROGRESS:
      return "in_progress";
    case TASK_STATUS_COMPLETED:
      return "completed";
    case TASK_STATUS_FAILED:
      return "failed";
    default:
      return "";
  }
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view name) {
  using namespace hivestate::state::v1;
  if (name == "pending") return TASK_STATUS_PENDING;
  if (name == "assigned") return TASK_STATUS_ASSIGNED;
  if (name == "in_progress") return TASK_STATUS_IN_PROGRESS;
  if (name == "completed") return TASK_STATUS_COMPLETED;
  if (name == "failed") return TASK_STATUS_FAILED;
  return std::nullopt;
}

} // namespace hivestate::model
