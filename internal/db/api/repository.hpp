#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/util/result.hpp"

namespace hivestate::db {

using util::ErrorCode;
using util::Result;

struct PoolStats {
  uint64_t size            = 0; // live connections
  uint64_t idle            = 0;
  uint64_t min_size        = 0;
  uint64_t max_size        = 0;
  uint64_t acquire_waits   = 0; // acquisitions that had to wait
  uint64_t acquire_timeouts = 0;
  double   last_acquire_ms = 0.0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - AssignTask / TransitionTask are compare-and-set on the stored status;
    exclusive task assignment depends on this behavior

  Writes report expected outcomes (NotFound, Conflict, AlreadyExists) through
  Result. Backend failures (connectivity, timeouts, driver errors) are thrown
  as util::StoreError.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Agents
  // ---------------------------------------------------------------------

  // Insert; on existing agent_id only capabilities and last_activity change.
  virtual Result UpsertAgent(Transaction&, const model::AgentRecord&) = 0;

  virtual std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& agent_id) = 0;

  // NotFound when no row matched.
  virtual Result PatchAgent(Transaction&, const model::AgentPatch&) = 0;

  // status idle|busy and last_activity >= since_ms, most recent first.
  virtual std::vector<model::AgentRecord> ListActiveAgents(Transaction&, uint64_t since_ms) = 0;


  // Rows whose agent_id does not start with exclude_prefix (empty = all).
  virtual uint64_t CountAgents(Transaction&, const std::string& exclude_prefix) = 0;

  // Clears current_task_id and returns the agent to idle, only while the
  // agent still points at task_id. Ok even when nothing matched.
  virtual Result ReleaseAgentTask(Transaction&, const std::string& agent_id, const std::string& task_id, uint64_t at_ms) = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  // Fills task_id / created_at_ms / created_seq when unset.
  // AlreadyExists on duplicate id, ConstraintViolation on unknown agent.
  virtual Result InsertTask(Transaction&, model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) = 0;

  // priority DESC, created_at ASC, insertion order.
  virtual std::vector<model::TaskRecord> ListPendingTasks(Transaction&, uint64_t limit) = 0;

  // pending -> assigned. Conflict if the task is not pending (or missing).
  virtual Result AssignTask(Transaction&, const std::string& task_id, const std::string& agent_id, uint64_t at_ms) = 0;

  virtual Result TransitionTask(Transaction&, const model::TaskTransition&) = 0;

  // ---------------------------------------------------------------------
  // Snapshots / checkpoints (append-only)
  // ---------------------------------------------------------------------

  // Aggregates current agent/task rows into a new snapshot row.
  virtual Result InsertComputedSnapshot(Transaction&, uint64_t at_ms) = 0;

  // Inserts the given values verbatim (imports). Fills id.
  virtual Result InsertSnapshot(Transaction&, model::SnapshotRecord&) = 0;

  // timestamp >= since_ms, newest first.
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, uint64_t since_ms, uint64_t limit) = 0;

  // Fills id.
  virtual Result InsertCheckpoint(Transaction&, model::CheckpointRecord&) = 0;

  virtual std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const model::CheckpointQuery&) = 0;

  // ---------------------------------------------------------------------
  // Health
  // ---------------------------------------------------------------------

  // Cheap round trip ("SELECT 1"). Throws on failure.
  virtual void Probe(Transaction&) = 0;

  virtual PoolStats Stats() const = 0;
};

} // namespace hivestate::db
