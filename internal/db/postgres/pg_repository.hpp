#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace hivestate::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
