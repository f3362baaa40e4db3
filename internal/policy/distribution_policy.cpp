#include "distribution_policy.hpp"

#include <utility>

namespace hivestate::policy {

namespace {

Rule Persistent(CacheAction action = CacheAction::kNone, std::string key = {}, std::chrono::seconds ttl = std::chrono::seconds(0)) {
  return Rule{StoreLayer::kPersistent, Consistency::kStrong, Strategy::kPersistentOnly, action, std::move(key), ttl};
}

Rule Ephemeral(StoreLayer layer, Consistency consistency, Strategy strategy, std::string key, std::chrono::seconds ttl) {
  return Rule{layer, consistency, strategy, CacheAction::kNone, std::move(key), ttl};
}

} // namespace

DistributionPolicy::DistributionPolicy(const config::EphemeralSettings& ephemeral, const config::CacheSettings& cache) {
  const std::string agent_key = "agent:state:{agent_id}";
  const std::string task_key  = "task:cache:{task_id}";

  auto set = [this](Operation op, Rule rule) { rules_[static_cast<std::size_t>(op)] = std::move(rule); };

  // Agents
  if (cache.cache_agent_state) {
    set(Operation::kRegisterAgent, Persistent(CacheAction::kRefresh, agent_key, cache.agent_ttl));
    set(Operation::kGetAgentState,
        Rule{StoreLayer::kPersistent, Consistency::kEventual, Strategy::kCacheAside, CacheAction::kRefresh, agent_key, cache.agent_ttl});
    set(Operation::kUpdateAgentState,
        Rule{StoreLayer::kPersistent, Consistency::kEventual, Strategy::kWriteThrough, CacheAction::kRefresh, agent_key, cache.agent_ttl});
    set(Operation::kRemoveAgent, Persistent(CacheAction::kInvalidate, agent_key));
    set(Operation::kBatchUpdateAgents, Persistent(CacheAction::kInvalidate, agent_key));
    set(Operation::kAssignTask, Persistent(CacheAction::kInvalidate, task_key));
  } else {
    set(Operation::kRegisterAgent, Persistent());
    set(Operation::kGetAgentState, Persistent());
    set(Operation::kUpdateAgentState, Persistent());
    set(Operation::kRemoveAgent, Persistent());
    set(Operation::kBatchUpdateAgents, Persistent());
    set(Operation::kAssignTask, Persistent(CacheAction::kInvalidate, task_key));
  }
  set(Operation::kGetActiveAgents, Persistent());

  // Tasks
  if (cache.cache_task_data) {
    set(Operation::kGetTask,
        Rule{StoreLayer::kPersistent, Consistency::kEventual, Strategy::kCacheAside, CacheAction::kRefresh, task_key, cache.task_ttl});
    set(Operation::kCacheTask, Ephemeral(StoreLayer::kEphemeral, Consistency::kEventual, Strategy::kWriteThrough, task_key, cache.task_ttl));
  } else {
    set(Operation::kGetTask, Persistent());
    set(Operation::kCacheTask, Persistent());
  }
  set(Operation::kCreateTask, Persistent());
  set(Operation::kGetPendingTasks, Persistent());
  set(Operation::kStartTask, Persistent(CacheAction::kInvalidate, task_key));
  set(Operation::kFinishTask, Persistent(CacheAction::kInvalidate, task_key));

  // System records
  set(Operation::kCreateCheckpoint, Persistent());
  set(Operation::kGetCheckpoints, Persistent());
  set(Operation::kCreateSystemSnapshot, Persistent());

  // Ephemeral-only
  set(Operation::kQueueTask, Ephemeral(StoreLayer::kStream, Consistency::kEventual, Strategy::kEphemeralOnly, "tasks:pending", {}));
  set(Operation::kConsumeTasks, Ephemeral(StoreLayer::kStream, Consistency::kEventual, Strategy::kEphemeralOnly, "tasks:pending", {}));
  set(Operation::kPublishEvent, Ephemeral(StoreLayer::kStream, Consistency::kEventual, Strategy::kWriteThrough, "events:system", {}));
  set(Operation::kConsumeEvents, Ephemeral(StoreLayer::kStream, Consistency::kEventual, Strategy::kEphemeralOnly, "events:system", {}));
  set(Operation::kIncrementMetric,
      Ephemeral(StoreLayer::kEphemeral, Consistency::kEventual, Strategy::kWriteThrough, "metrics:{name}", ephemeral.metric_ttl));
  set(Operation::kSession,
      Ephemeral(StoreLayer::kEphemeral, Consistency::kSession, Strategy::kEphemeralOnly, "session:{session_id}", ephemeral.session_ttl));
  set(Operation::kCoordination, Ephemeral(StoreLayer::kEphemeral, Consistency::kEventual, Strategy::kEphemeralOnly,
                                          "coord:{operation_id}", ephemeral.coordination_ttl));
}

const char* DistributionPolicy::Name(Operation op) {
  switch (op) {
    case Operation::kRegisterAgent:
      return "register_agent";
    case Operation::kGetAgentState:
      return "get_agent_state";
    case Operation::kUpdateAgentState:
      return "update_agent_state";
    case Operation::kRemoveAgent:
      return "remove_agent";
    case Operation::kBatchUpdateAgents:
      return "batch_update_agents";
    case Operation::kGetActiveAgents:
      return "get_active_agents";
    case Operation::kCreateTask:
      return "create_task";
    case Operation::kGetTask:
      return "get_task";
    case Operation::kGetPendingTasks:
      return "get_pending_tasks";
    case Operation::kAssignTask:
      return "assign_task";
    case Operation::kStartTask:
      return "start_task";
    case Operation::kFinishTask:
      return "finish_task";
    case Operation::kCacheTask:
      return "cache_task";
    case Operation::kCreateCheckpoint:
      return "create_checkpoint";
    case Operation::kGetCheckpoints:
      return "get_checkpoints";
    case Operation::kCreateSystemSnapshot:
      return "create_system_snapshot";
    case Operation::kQueueTask:
      return "queue_task";
    case Operation::kConsumeTasks:
      return "consume_tasks";
    case Operation::kPublishEvent:
      return "publish_event";
    case Operation::kConsumeEvents:
      return "consume_events";
    case Operation::kIncrementMetric:
      return "increment_metric";
    case Operation::kSession:
      return "session";
    case Operation::kCoordination:
      return "coordination";
    case Operation::kCount:
      break;
  }
  return "unknown";
}

const char* ToString(StoreLayer layer) {
  switch (layer) {
    case StoreLayer::kPersistent:
      return "persistent";
    case StoreLayer::kEphemeral:
      return "ephemeral";
    case StoreLayer::kStream:
      return "stream";
  }
  return "unknown";
}

const char* ToString(Consistency consistency) {
  switch (consistency) {
    case Consistency::kStrong:
      return "strong";
    case Consistency::kEventual:
      return "eventual";
    case Consistency::kSession:
      return "session";
  }
  return "unknown";
}

const char* ToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kPersistentOnly:
      return "persistent_only";
    case Strategy::kEphemeralOnly:
      return "ephemeral_only";
    case Strategy::kWriteThrough:
      return "write_through";
    case Strategy::kCacheAside:
      return "cache_aside";
  }
  return "unknown";
}

} // namespace hivestate::policy
