#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/state_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace hivestate::persistent {

namespace v1 = hivestate::state::v1;

struct PersistentHealth {
  bool          connected = false;
  db::PoolStats pool;
  double        sample_query_ms = 0.0;
  double        acquire_ms      = 0.0;
  std::string   error;
};

/*
  PersistentStore

  Durable state on top of a db::Repository. Every call is one transaction;
  SerializationFailure is retried up to `serialization_retries` times.
  Backend exceptions stop here and come back as a Result.
*/
class PersistentStore final : public core::StateManager {
 public:
  // Agents idle/busy with activity inside this window count as active.
  static constexpr std::chrono::hours kActiveWindow{1};

  explicit PersistentStore(std::shared_ptr<db::Repository> repo, int serialization_retries = 3);

  util::Result RegisterAgent(const std::string& agent_id, const std::vector<std::string>& capabilities) override;
  util::ValueResult<std::optional<v1::Agent>> GetAgentState(const std::string& agent_id) override;
  util::Result UpdateAgentState(const v1::AgentUpdate& update) override;
  util::Result RemoveAgent(const std::string& agent_id) override;
  util::ValueResult<std::vector<v1::Agent>> GetActiveAgents() override;
  util::ValueResult<uint64_t> BatchUpdateAgents(const std::vector<v1::AgentUpdate>& updates) override;

  util::ValueResult<std::string> CreateTask(const v1::NewTask& task) override;
  util::ValueResult<std::optional<v1::Task>> GetTask(const std::string& task_id) override;
  util::ValueResult<std::vector<v1::Task>> GetPendingTasks(std::size_t limit) override;
  util::Result AssignTask(const std::string& task_id, const std::string& agent_id) override;
  util::Result StartTask(const std::string& task_id) override;
  util::Result FinishTask(const std::string& task_id, v1::TaskStatus final_status,
                          const std::optional<google::protobuf::Value>& result) override;

  util::Result CreateSystemSnapshot() override;
  util::ValueResult<uint64_t> CreateCheckpoint(const std::string& name, const google::protobuf::Struct& data) override;

  // Migration support. An existing task id is left as stored.
  util::ValueResult<std::string> ImportTask(const v1::NewTask& task);
  util::Result                   ImportSnapshot(const v1::SystemSnapshot& snapshot);

  util::ValueResult<std::vector<v1::Checkpoint>>     GetCheckpoints(const db::model::CheckpointQuery& query);
  util::ValueResult<std::vector<v1::SystemSnapshot>> GetRecentSnapshots(util::TimePoint since, std::size_t limit);
  util::ValueResult<uint64_t>                        CountAgents(const std::string& exclude_prefix = {});

  PersistentHealth HealthCheck();

 private:
  template <typename Fn>
  auto Run(std::string_view op, Fn&& fn);

  std::shared_ptr<db::Repository> repo_;
  int                              serialization_retries_;
};

} // namespace hivestate::persistent
