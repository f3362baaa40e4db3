#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/state_manager.hpp"
#include "internal/ephemeral/ephemeral_store.hpp"
#include "internal/persistent/persistent_store.hpp"
#include "internal/policy/distribution_policy.hpp"

namespace hivestate::orchestrator {

namespace v1 = hivestate::state::v1;

struct PerformanceStats {
  uint64_t cache_hits     = 0;
  uint64_t cache_misses   = 0;
  double   hit_ratio      = 0.0;
  uint64_t reads          = 0;
  uint64_t writes         = 0;
  double   avg_latency_ms = 0.0; // EMA, alpha 0.1
  double   target         = 0.0;
  bool     performance_ok = true;
};

enum class HealthStatus {
  kHealthy,
  kDegraded,  // ephemeral layer down or hit ratio under target
  kUnhealthy, // persistent layer down
};

struct HybridHealth {
  HealthStatus                              status = HealthStatus::kUnhealthy;
  persistent::PersistentHealth              persistent;
  std::optional<ephemeral::EphemeralHealth> ephemeral; // unset = not configured
  PerformanceStats                          performance;
  bool                                      hit_ratio_ok = true;
};

const char* ToString(HealthStatus status);

/*
  HybridOrchestrator

  Front door over both stores. The persistent store decides every strong
  operation; the ephemeral store only ever holds copies, refreshed or
  evicted after the authoritative write succeeded. A cache failure never
  fails an operation that the persistent store completed.

  The ephemeral store is optional (nullptr): agent/task reads then go
  straight to the persistent store and ephemeral-only operations report
  Unavailable.
*/
class HybridOrchestrator final : public core::StateManager {
 public:
  static constexpr double kLatencyAlpha = 0.1;

  HybridOrchestrator(std::shared_ptr<persistent::PersistentStore> persistent, std::shared_ptr<ephemeral::EphemeralStore> ephemeral,
                     std::shared_ptr<const policy::DistributionPolicy> policy, double hit_ratio_target);

  // Stream groups; no-op without an ephemeral store.
  util::Result Initialize();

  // core::StateManager
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

  util::ValueResult<std::vector<v1::Checkpoint>> GetCheckpoints(const db::model::CheckpointQuery& query);

  // Cache copy of a task; skipped (ok) when task caching is disabled.
  util::Result CacheTask(const v1::Task& task);

  // Sessions / coordination
  util::Result CreateSession(const std::string& session_id, const google::protobuf::Struct& data);
  util::ValueResult<std::optional<google::protobuf::Struct>> GetSession(const std::string& session_id);
  util::ValueResult<bool> ExtendSession(const std::string& session_id);
  util::Result SetCoordinationState(const std::string& operation_id, const google::protobuf::Struct& state);
  util::ValueResult<std::optional<google::protobuf::Struct>> GetCoordinationState(const std::string& operation_id);

  // Streams
  util::ValueResult<std::string> QueueTask(const google::protobuf::Struct& task);
  util::ValueResult<std::vector<v1::StreamMessage>> ConsumeTasks(const std::string& group, const std::string& consumer,
                                                                 std::size_t count = 1);
  util::Result AcknowledgeTask(const std::string& group, const std::string& message_id);
  util::ValueResult<std::string> PublishEvent(const google::protobuf::Struct& event);
  util::ValueResult<std::vector<v1::StreamMessage>> ConsumeEvents(const std::string& group, const std::string& consumer,
                                                                  std::size_t count = 10);
  util::Result AcknowledgeEvent(const std::string& group, const std::string& message_id);

  // Metrics
  util::ValueResult<int64_t> IncrementMetric(const std::string& name, int64_t delta = 1);
  util::ValueResult<int64_t> GetMetric(const std::string& name);

  PerformanceStats GetPerformanceStats() const;
  HybridHealth     HealthCheck();

  persistent::PersistentStore& Persistent() {
    return *persistent_;
  }
  // nullptr when no ephemeral store is configured.
  ephemeral::EphemeralStore* Ephemeral() {
    return ephemeral_.get();
  }

 private:
  enum class Access { kRead, kWrite };

  void RecordLookup(bool hit);
  void RecordAccess(Access access, std::chrono::steady_clock::time_point started);

  bool CachesAgents() const;

  // Best-effort cache maintenance; failures are logged by the store.
  void RefreshAgent(const std::string& agent_id, policy::Operation op);
  void EvictAgent(const std::string& agent_id);
  void EvictTask(const std::string& task_id);

  util::Result EphemeralMissing(const char* op) const;

  std::shared_ptr<persistent::PersistentStore>      persistent_;
  std::shared_ptr<ephemeral::EphemeralStore>        ephemeral_;
  std::shared_ptr<const policy::DistributionPolicy> policy_;
  double                                            hit_ratio_target_;

  mutable std::mutex stats_mutex_;
  PerformanceStats   stats_;
  bool               latency_seeded_ = false;
};

} // namespace hivestate::orchestrator
