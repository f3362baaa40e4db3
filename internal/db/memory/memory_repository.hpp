#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace hivestate::db::memory {

class MemoryTransaction;

/*
  In-process repository. Transactions work on a private copy of the state and
  publish it at commit if nobody committed in between.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAgent(Transaction&, const model::AgentRecord&) override;
  std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string&) override;
  Result PatchAgent(Transaction&, const model::AgentPatch&) override;
  std::vector<model::AgentRecord> ListActiveAgents(Transaction&, uint64_t since_ms) override;
  uint64_t CountAgents(Transaction&, const std::string& exclude_prefix) override;
  Result ReleaseAgentTask(Transaction&, const std::string& agent_id, const std::string& task_id,
                          uint64_t at_ms) override;

  Result InsertTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  std::vector<model::TaskRecord> ListPendingTasks(Transaction&, uint64_t limit) override;
  Result AssignTask(Transaction&, const std::string& task_id, const std::string& agent_id,
                    uint64_t at_ms) override;
  Result TransitionTask(Transaction&, const model::TaskTransition&) override;

  Result InsertComputedSnapshot(Transaction&, uint64_t at_ms) override;
  Result InsertSnapshot(Transaction&, model::SnapshotRecord&) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, uint64_t since_ms, uint64_t limit) override;
  Result InsertCheckpoint(Transaction&, model::CheckpointRecord&) override;
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const model::CheckpointQuery&) override;

  void Probe(Transaction&) override;
  PoolStats Stats() const override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AgentRecord> agents;
    std::unordered_map<std::string, model::TaskRecord> tasks;
    std::vector<model::SnapshotRecord> snapshots;
    std::vector<model::CheckpointRecord> checkpoints;

    uint64_t next_task_seq = 1;
    uint64_t next_snapshot_id = 1;
    uint64_t next_checkpoint_id = 1;
  };

  mutable std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
