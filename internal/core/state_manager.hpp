#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hivestate/state/v1.hpp"
#include "internal/util/result.hpp"

namespace hivestate::core {

namespace v1 = hivestate::state::v1;

/*
  StateManager

  The state operation set shared by the persistent store and the hybrid
  orchestrator. Callers that only need the core operations depend on this
  interface so either implementation (or a test double) can be injected.

  Nothing here throws. "Not found" reads are ok results with an empty
  optional; a lost assignment race is ErrorCode::Conflict.
*/
class StateManager {
 public:
  virtual ~StateManager() = default;

  // -------------------------------------------------------------------
  // Agents
  // -------------------------------------------------------------------

  virtual util::Result RegisterAgent(const std::string& agent_id, const std::vector<std::string>& capabilities) = 0;

  virtual util::ValueResult<std::optional<v1::Agent>> GetAgentState(const std::string& agent_id) = 0;

  virtual util::Result UpdateAgentState(const v1::AgentUpdate& update) = 0;

  // Status offline; the row is kept.
  virtual util::Result RemoveAgent(const std::string& agent_id) = 0;

  virtual util::ValueResult<std::vector<v1::Agent>> GetActiveAgents() = 0;

  // Rows actually updated; unknown ids contribute nothing.
  virtual util::ValueResult<uint64_t> BatchUpdateAgents(const std::vector<v1::AgentUpdate>& updates) = 0;

  // -------------------------------------------------------------------
  // Tasks
  // -------------------------------------------------------------------

  virtual util::ValueResult<std::string> CreateTask(const v1::NewTask& task) = 0;

  virtual util::ValueResult<std::optional<v1::Task>> GetTask(const std::string& task_id) = 0;

  virtual util::ValueResult<std::vector<v1::Task>> GetPendingTasks(std::size_t limit) = 0;

  virtual util::Result AssignTask(const std::string& task_id, const std::string& agent_id) = 0;

  virtual util::Result StartTask(const std::string& task_id) = 0;

  // final_status must be completed or failed.
  virtual util::Result FinishTask(const std::string& task_id, v1::TaskStatus final_status,
                                  const std::optional<google::protobuf::Value>& result) = 0;

  // -------------------------------------------------------------------
  // System records
  // -------------------------------------------------------------------

  virtual util::Result CreateSystemSnapshot() = 0;

  // Empty name becomes "checkpoint_<iso time>".
  virtual util::ValueResult<uint64_t> CreateCheckpoint(const std::string& name, const google::protobuf::Struct& data) = 0;
};

} // namespace hivestate::core
