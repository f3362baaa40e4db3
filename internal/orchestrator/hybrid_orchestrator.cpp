#include "hybrid_orchestrator.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace hivestate::orchestrator {

using hivestate::observability::StringField;
using policy::CacheAction;
using policy::Operation;
using policy::Strategy;
using util::ErrorCode;
using util::Result;
using util::ValueResult;

const char* ToString(HealthStatus status) {
  switch (status) {
    case HealthStatus::kHealthy:
      return "healthy";
    case HealthStatus::kDegraded:
      return "degraded";
    case HealthStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

HybridOrchestrator::HybridOrchestrator(std::shared_ptr<persistent::PersistentStore> persistent,
                                       std::shared_ptr<ephemeral::EphemeralStore> ephemeral,
                                       std::shared_ptr<const policy::DistributionPolicy> policy, double hit_ratio_target)
    : persistent_(std::move(persistent)), ephemeral_(std::move(ephemeral)), policy_(std::move(policy)), hit_ratio_target_(hit_ratio_target) {
  if (!persistent_ || !policy_) {
    throw std::invalid_argument("HybridOrchestrator: persistent store and policy are required");
  }
  stats_.target = hit_ratio_target_;
}

Result HybridOrchestrator::Initialize() {
  if (!ephemeral_) {
    return Result::Ok();
  }
  return ephemeral_->Initialize();
}

Result HybridOrchestrator::EphemeralMissing(const char* op) const {
  return Result::Err(ErrorCode::Unavailable, std::string(op) + ": ephemeral store not configured");
}

// ---------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------

void HybridOrchestrator::RecordLookup(bool hit) {
  std::lock_guard lock(stats_mutex_);
  if (hit) {
    ++stats_.cache_hits;
  } else {
    ++stats_.cache_misses;
  }
}

void HybridOrchestrator::RecordAccess(Access access, std::chrono::steady_clock::time_point started) {
  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

  std::lock_guard lock(stats_mutex_);
  if (access == Access::kRead) {
    ++stats_.reads;
  } else {
    ++stats_.writes;
  }
  if (!latency_seeded_) {
    stats_.avg_latency_ms = elapsed_ms;
    latency_seeded_       = true;
  } else {
    stats_.avg_latency_ms = kLatencyAlpha * elapsed_ms + (1.0 - kLatencyAlpha) * stats_.avg_latency_ms;
  }
}

PerformanceStats HybridOrchestrator::GetPerformanceStats() const {
  std::lock_guard lock(stats_mutex_);
  PerformanceStats out = stats_;

  const uint64_t lookups = out.cache_hits + out.cache_misses;
  out.hit_ratio          = lookups == 0 ? 0.0 : static_cast<double>(out.cache_hits) / static_cast<double>(lookups);
  out.performance_ok     = lookups == 0 || out.hit_ratio >= hit_ratio_target_;
  return out;
}

// ---------------------------------------------------------------------
// Cache maintenance
// ---------------------------------------------------------------------

bool HybridOrchestrator::CachesAgents() const {
  return ephemeral_ && policy_->For(Operation::kGetAgentState).strategy == Strategy::kCacheAside;
}

void HybridOrchestrator::RefreshAgent(const std::string& agent_id, Operation op) {
  const auto& rule = policy_->For(op);
  if (!ephemeral_ || rule.cache_action != CacheAction::kRefresh) {
    return;
  }

  // Cache the full row as stored, not the caller's partial view.
  auto fresh = persistent_->GetAgentState(agent_id);
  if (!fresh.ok() || !fresh.value) {
    EvictAgent(agent_id);
    return;
  }
  if (!ephemeral_->SetAgentState(*fresh.value, rule.ttl)) {
    HIVESTATE_LOG_DEBUG("Agent cache refresh skipped", {StringField("agent_id", agent_id)});
  }
}

void HybridOrchestrator::EvictAgent(const std::string& agent_id) {
  if (!CachesAgents()) {
    return;
  }
  if (!ephemeral_->DeleteAgentState(agent_id)) {
    HIVESTATE_LOG_DEBUG("Agent cache eviction skipped", {StringField("agent_id", agent_id)});
  }
}

void HybridOrchestrator::EvictTask(const std::string& task_id) {
  if (!ephemeral_) {
    return;
  }
  if (!ephemeral_->DeleteCachedTask(task_id)) {
    HIVESTATE_LOG_DEBUG("Task cache eviction skipped", {StringField("task_id", task_id)});
  }
}

// ---------------------------------------------------------------------
// Agents
// ---------------------------------------------------------------------

Result HybridOrchestrator::RegisterAgent(const std::string& agent_id, const std::vector<std::string>& capabilities) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->RegisterAgent(agent_id, capabilities);
  if (r) {
    RefreshAgent(agent_id, Operation::kRegisterAgent);
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

ValueResult<std::optional<v1::Agent>> HybridOrchestrator::GetAgentState(const std::string& agent_id) {
  const auto  started = std::chrono::steady_clock::now();
  const auto& rule    = policy_->For(Operation::kGetAgentState);

  const bool cache_aside = ephemeral_ && rule.strategy == Strategy::kCacheAside;
  if (cache_aside) {
    auto cached = ephemeral_->GetAgentState(agent_id);
    if (cached.ok() && cached.value) {
      RecordLookup(true);
      RecordAccess(Access::kRead, started);
      return cached;
    }
    // Unreachable cache counts as a miss.
    RecordLookup(false);
  }

  auto stored = persistent_->GetAgentState(agent_id);
  if (stored.ok() && stored.value && cache_aside) {
    if (!ephemeral_->SetAgentState(*stored.value, rule.ttl)) {
      HIVESTATE_LOG_DEBUG("Agent cache fill skipped", {StringField("agent_id", agent_id)});
    }
  }
  RecordAccess(Access::kRead, started);
  return stored;
}

Result HybridOrchestrator::UpdateAgentState(const v1::AgentUpdate& update) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->UpdateAgentState(update);
  if (r) {
    RefreshAgent(update.agent_id(), Operation::kUpdateAgentState);
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

Result HybridOrchestrator::RemoveAgent(const std::string& agent_id) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->RemoveAgent(agent_id);
  if (r) {
    EvictAgent(agent_id);
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

ValueResult<std::vector<v1::Agent>> HybridOrchestrator::GetActiveAgents() {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->GetActiveAgents();
  RecordAccess(Access::kRead, started);
  return r;
}

ValueResult<uint64_t> HybridOrchestrator::BatchUpdateAgents(const std::vector<v1::AgentUpdate>& updates) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->BatchUpdateAgents(updates);
  if (r.ok()) {
    for (const auto& update : updates) {
      EvictAgent(update.agent_id());
    }
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

// ---------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------

ValueResult<std::string> HybridOrchestrator::CreateTask(const v1::NewTask& task) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->CreateTask(task);
  RecordAccess(Access::kWrite, started);
  return r;
}

ValueResult<std::optional<v1::Task>> HybridOrchestrator::GetTask(const std::string& task_id) {
  const auto  started = std::chrono::steady_clock::now();
  const auto& rule    = policy_->For(Operation::kGetTask);

  const bool cache_aside = ephemeral_ && rule.strategy == Strategy::kCacheAside;
  if (cache_aside) {
    auto cached = ephemeral_->GetCachedTask(task_id);
    if (cached.ok() && cached.value) {
      RecordLookup(true);
      RecordAccess(Access::kRead, started);
      return cached;
    }
    RecordLookup(false);
  }

  auto stored = persistent_->GetTask(task_id);
  if (stored.ok() && stored.value && cache_aside) {
    if (!ephemeral_->CacheTask(*stored.value, rule.ttl)) {
      HIVESTATE_LOG_DEBUG("Task cache fill skipped", {StringField("task_id", task_id)});
    }
  }
  RecordAccess(Access::kRead, started);
  return stored;
}

ValueResult<std::vector<v1::Task>> HybridOrchestrator::GetPendingTasks(std::size_t limit) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->GetPendingTasks(limit);
  RecordAccess(Access::kRead, started);
  return r;
}

Result HybridOrchestrator::AssignTask(const std::string& task_id, const std::string& agent_id) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->AssignTask(task_id, agent_id);
  if (r) {
    if (policy_->For(Operation::kAssignTask).cache_action == CacheAction::kInvalidate) {
      EvictTask(task_id);
    }
    EvictAgent(agent_id);
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

Result HybridOrchestrator::StartTask(const std::string& task_id) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->StartTask(task_id);
  if (r && policy_->For(Operation::kStartTask).cache_action == CacheAction::kInvalidate) {
    EvictTask(task_id);
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

Result HybridOrchestrator::FinishTask(const std::string& task_id, v1::TaskStatus final_status,
                                      const std::optional<google::protobuf::Value>& result) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->FinishTask(task_id, final_status, result);
  if (r) {
    if (policy_->For(Operation::kFinishTask).cache_action == CacheAction::kInvalidate) {
      EvictTask(task_id);
    }
    // The owning agent went back to idle in the same transaction.
    auto task = persistent_->GetTask(task_id);
    if (task.ok() && task.value && !task.value->agent_id().empty()) {
      EvictAgent(task.value->agent_id());
    }
  }
  RecordAccess(Access::kWrite, started);
  return r;
}

Result HybridOrchestrator::CacheTask(const v1::Task& task) {
  const auto& rule = policy_->For(Operation::kCacheTask);
  if (rule.strategy != Strategy::kWriteThrough) {
    return Result::Ok();
  }
  if (!ephemeral_) {
    return EphemeralMissing("CacheTask");
  }
  return ephemeral_->CacheTask(task, rule.ttl);
}

// ---------------------------------------------------------------------
// System records
// ---------------------------------------------------------------------

Result HybridOrchestrator::CreateSystemSnapshot() {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->CreateSystemSnapshot();
  RecordAccess(Access::kWrite, started);
  return r;
}

ValueResult<uint64_t> HybridOrchestrator::CreateCheckpoint(const std::string& name, const google::protobuf::Struct& data) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->CreateCheckpoint(name, data);
  RecordAccess(Access::kWrite, started);
  return r;
}

ValueResult<std::vector<v1::Checkpoint>> HybridOrchestrator::GetCheckpoints(const db::model::CheckpointQuery& query) {
  const auto started = std::chrono::steady_clock::now();
  auto       r       = persistent_->GetCheckpoints(query);
  RecordAccess(Access::kRead, started);
  return r;
}

// ---------------------------------------------------------------------
// Ephemeral-only pass-throughs
// ---------------------------------------------------------------------

Result HybridOrchestrator::CreateSession(const std::string& session_id, const google::protobuf::Struct& data) {
  if (!ephemeral_) {
    return EphemeralMissing("CreateSession");
  }
  return ephemeral_->CreateSession(session_id, data, policy_->For(Operation::kSession).ttl);
}

ValueResult<std::optional<google::protobuf::Struct>> HybridOrchestrator::GetSession(const std::string& session_id) {
  if (!ephemeral_) {
    return ValueResult<std::optional<google::protobuf::Struct>>::Err(EphemeralMissing("GetSession"));
  }
  return ephemeral_->GetSession(session_id);
}

ValueResult<bool> HybridOrchestrator::ExtendSession(const std::string& session_id) {
  if (!ephemeral_) {
    return ValueResult<bool>::Err(EphemeralMissing("ExtendSession"));
  }
  return ephemeral_->ExtendSession(session_id, policy_->For(Operation::kSession).ttl);
}

Result HybridOrchestrator::SetCoordinationState(const std::string& operation_id, const google::protobuf::Struct& state) {
  if (!ephemeral_) {
    return EphemeralMissing("SetCoordinationState");
  }
  return ephemeral_->SetCoordinationState(operation_id, state, policy_->For(Operation::kCoordination).ttl);
}

ValueResult<std::optional<google::protobuf::Struct>> HybridOrchestrator::GetCoordinationState(const std::string& operation_id) {
  if (!ephemeral_) {
    return ValueResult<std::optional<google::protobuf::Struct>>::Err(EphemeralMissing("GetCoordinationState"));
  }
  return ephemeral_->GetCoordinationState(operation_id);
}

ValueResult<std::string> HybridOrchestrator::QueueTask(const google::protobuf::Struct& task) {
  if (!ephemeral_) {
    return ValueResult<std::string>::Err(EphemeralMissing("QueueTask"));
  }
  return ephemeral_->QueueTask(task);
}

ValueResult<std::vector<v1::StreamMessage>> HybridOrchestrator::ConsumeTasks(const std::string& group, const std::string& consumer,
                                                                             std::size_t count) {
  if (!ephemeral_) {
    return ValueResult<std::vector<v1::StreamMessage>>::Err(EphemeralMissing("ConsumeTasks"));
  }
  return ephemeral_->ConsumeTasks(group, consumer, count);
}

Result HybridOrchestrator::AcknowledgeTask(const std::string& group, const std::string& message_id) {
  if (!ephemeral_) {
    return EphemeralMissing("AcknowledgeTask");
  }
  return ephemeral_->AcknowledgeTask(group, message_id);
}

ValueResult<std::string> HybridOrchestrator::PublishEvent(const google::protobuf::Struct& event) {
  if (!ephemeral_) {
    return ValueResult<std::string>::Err(EphemeralMissing("PublishEvent"));
  }
  return ephemeral_->PublishEvent(event);
}

ValueResult<std::vector<v1::StreamMessage>> HybridOrchestrator::ConsumeEvents(const std::string& group, const std::string& consumer,
                                                                              std::size_t count) {
  if (!ephemeral_) {
    return ValueResult<std::vector<v1::StreamMessage>>::Err(EphemeralMissing("ConsumeEvents"));
  }
  return ephemeral_->ConsumeEvents(group, consumer, count);
}

Result HybridOrchestrator::AcknowledgeEvent(const std::string& group, const std::string& message_id) {
  if (!ephemeral_) {
    return EphemeralMissing("AcknowledgeEvent");
  }
  return ephemeral_->AcknowledgeEvent(group, message_id);
}

ValueResult<int64_t> HybridOrchestrator::IncrementMetric(const std::string& name, int64_t delta) {
  if (!ephemeral_) {
    return ValueResult<int64_t>::Err(EphemeralMissing("IncrementMetric"));
  }
  return ephemeral_->IncrementMetric(name, delta);
}

ValueResult<int64_t> HybridOrchestrator::GetMetric(const std::string& name) {
  if (!ephemeral_) {
    return ValueResult<int64_t>::Err(EphemeralMissing("GetMetric"));
  }
  return ephemeral_->GetMetric(name);
}

// ---------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------

HybridHealth HybridOrchestrator::HealthCheck() {
  HybridHealth health;
  health.persistent = persistent_->HealthCheck();
  if (ephemeral_) {
    health.ephemeral = ephemeral_->HealthCheck();
  }
  health.performance  = GetPerformanceStats();
  health.hit_ratio_ok = health.performance.performance_ok;

  if (!health.persistent.connected) {
    health.status = HealthStatus::kUnhealthy;
  } else if ((health.ephemeral && !health.ephemeral->connected) || !health.hit_ratio_ok) {
    health.status = HealthStatus::kDegraded;
  } else {
    health.status = HealthStatus::kHealthy;
  }
  return health;
}

} // namespace hivestate::orchestrator
