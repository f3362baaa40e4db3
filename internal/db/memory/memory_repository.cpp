#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "memory_tx.hpp"

namespace hivestate::db::memory {

using hivestate::state::v1::AGENT_STATUS_BUSY;
using hivestate::state::v1::AGENT_STATUS_IDLE;
using hivestate::state::v1::TASK_STATUS_ASSIGNED;
using hivestate::state::v1::TASK_STATUS_COMPLETED;
using hivestate::state::v1::TASK_STATUS_FAILED;
using hivestate::state::v1::TASK_STATUS_PENDING;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.agents.find(r.agent_id);
  if (it != s.agents.end()) {
    it->second.capabilities_json = r.capabilities_json;
    it->second.last_activity_ms  = r.last_activity_ms;
    it->second.updated_at_ms     = r.last_activity_ms;
    return Result::Ok();
  }

  auto inserted = r;
  if (inserted.created_at_ms == 0) inserted.created_at_ms = r.last_activity_ms;
  inserted.updated_at_ms = inserted.created_at_ms;
  s.agents.emplace(r.agent_id, std::move(inserted));
  return Result::Ok();
}

std::optional<model::AgentRecord> MemoryRepository::GetAgent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.agents.find(id);
  if (it == s.agents.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PatchAgent(Transaction& t, const model::AgentPatch& p) {
  auto& s  = TX(t).Mutable();
  auto  it = s.agents.find(p.agent_id);
  if (it == s.agents.end()) return Result::Err(ErrorCode::NotFound, "agent not found: " + p.agent_id);

  auto& a = it->second;
  if (p.status) a.status = *p.status;
  if (p.clear_current_task) {
    a.current_task_id.clear();
  } else if (p.current_task_id) {
    a.current_task_id = *p.current_task_id;
  }
  if (p.context_usage) a.context_usage = *p.context_usage;
  if (p.performance_metrics_json) a.performance_metrics_json = *p.performance_metrics_json;
  a.last_activity_ms = p.at_ms;
  a.updated_at_ms    = p.at_ms;
  return Result::Ok();
}

std::vector<model::AgentRecord> MemoryRepository::ListActiveAgents(Transaction& t, uint64_t since_ms) {
  std::vector<model::AgentRecord> out;
  for (const auto& [_, a] : TX(t).View().agents) {
    if ((a.status == AGENT_STATUS_IDLE || a.status == AGENT_STATUS_BUSY) && a.last_activity_ms >= since_ms) {
      out.push_back(a);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& l, const auto& r) {
    return l.last_activity_ms > r.last_activity_ms;
  });
  return out;
}

uint64_t MemoryRepository::CountAgents(Transaction& t, const std::string& exclude_prefix) {
  uint64_t count = 0;
  for (const auto& [id, _] : TX(t).View().agents) {
    if (!exclude_prefix.empty() && id.rfind(exclude_prefix, 0) == 0) continue;
    ++count;
  }
  return count;
}

Result MemoryRepository::ReleaseAgentTask(Transaction& t, const std::string& agent_id, const std::string& task_id, uint64_t at_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.agents.find(agent_id);
  if (it == view.agents.end() || it->second.current_task_id != task_id) return Result::Ok();

  auto& a = TX(t).Mutable().agents.at(agent_id);
  a.current_task_id.clear();
  a.status           = AGENT_STATUS_IDLE;
  a.last_activity_ms = at_ms;
  a.updated_at_ms    = at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.task_id.empty()) r.task_id = util::NewId();
  if (s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.task_id);
  if (!r.agent_id.empty() && !s.agents.contains(r.agent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown agent: " + r.agent_id);
  }
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  r.created_seq = s.next_task_seq++;
  s.tasks[r.task_id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListPendingTasks(Transaction& t, uint64_t limit) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, task] : TX(t).View().tasks) {
    if (task.status == TASK_STATUS_PENDING) out.push_back(task);
  }
  std::sort(out.begin(), out.end(), [](const auto& l, const auto& r) {
    if (l.priority != r.priority) return l.priority > r.priority;
    if (l.created_at_ms != r.created_at_ms) return l.created_at_ms < r.created_at_ms;
    return l.created_seq < r.created_seq;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::AssignTask(Transaction& t, const std::string& task_id, const std::string& agent_id, uint64_t at_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.tasks.find(task_id);
  if (it == view.tasks.end() || it->second.status != TASK_STATUS_PENDING) {
    return Result::Err(ErrorCode::Conflict, "task not pending: " + task_id);
  }
  if (!view.agents.contains(agent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown agent: " + agent_id);
  }

  auto& task         = TX(t).Mutable().tasks.at(task_id);
  task.agent_id      = agent_id;
  task.status        = TASK_STATUS_ASSIGNED;
  task.started_at_ms = at_ms;
  return Result::Ok();
}

Result MemoryRepository::TransitionTask(Transaction& t, const model::TaskTransition& tr) {
  const auto& view = TX(t).View();
  auto        it   = view.tasks.find(tr.task_id);
  if (it == view.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + tr.task_id);
  if (it->second.status != tr.from_a && it->second.status != tr.from_b) {
    return Result::Err(ErrorCode::Conflict, "task status changed: " + tr.task_id);
  }

  auto& task  = TX(t).Mutable().tasks.at(tr.task_id);
  task.status = tr.to;
  if (tr.result_json) task.result_json = *tr.result_json;
  if (tr.set_completed_at) task.completed_at_ms = tr.at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshots / checkpoints
// ------------------------------------------------------------------

Result MemoryRepository::InsertComputedSnapshot(Transaction& t, uint64_t at_ms) {
  auto& s = TX(t).Mutable();

  model::SnapshotRecord snap;
  snap.timestamp_ms = at_ms;

  double usage_sum = 0.0;
  for (const auto& [_, a] : s.agents) {
    ++snap.total_agents;
    if (a.status == AGENT_STATUS_IDLE || a.status == AGENT_STATUS_BUSY) ++snap.active_agents;
    usage_sum += a.context_usage;
  }
  if (snap.total_agents > 0) snap.average_context_usage = usage_sum / static_cast<double>(snap.total_agents);

  for (const auto& [_, task] : s.tasks) {
    ++snap.total_tasks;
    if (task.status == TASK_STATUS_COMPLETED) ++snap.completed_tasks;
    if (task.status == TASK_STATUS_FAILED) ++snap.failed_tasks;
  }

  snap.id = s.next_snapshot_id++;
  s.snapshots.push_back(std::move(snap));
  return Result::Ok();
}

Result MemoryRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_snapshot_id++;
  s.snapshots.push_back(r);
  return Result::Ok();
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction& t, uint64_t since_ms, uint64_t limit) {
  std::vector<model::SnapshotRecord> out;
  for (const auto& snap : TX(t).View().snapshots) {
    if (snap.timestamp_ms >= since_ms) out.push_back(snap);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& l, const auto& r) {
    if (l.timestamp_ms != r.timestamp_ms) return l.timestamp_ms > r.timestamp_ms;
    return l.id > r.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::InsertCheckpoint(Transaction& t, model::CheckpointRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_checkpoint_id++;
  if (r.timestamp_ms == 0) r.timestamp_ms = util::NowMillis();
  s.checkpoints.push_back(r);
  return Result::Ok();
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpoints(Transaction& t, const model::CheckpointQuery& q) {
  std::vector<model::CheckpointRecord> out;
  for (const auto& c : TX(t).View().checkpoints) {
    if (q.name && c.name != *q.name) continue;
    if (q.since_ms && c.timestamp_ms < *q.since_ms) continue;
    if (q.until_ms && c.timestamp_ms > *q.until_ms) continue;
    out.push_back(c);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& l, const auto& r) {
    if (l.timestamp_ms != r.timestamp_ms) return l.timestamp_ms > r.timestamp_ms;
    return l.id > r.id;
  });
  if (out.size() > q.limit) out.resize(q.limit);
  return out;
}

void MemoryRepository::Probe(Transaction&) {
}

PoolStats MemoryRepository::Stats() const {
  PoolStats stats;
  stats.size     = 1;
  stats.idle     = 1;
  stats.min_size = 1;
  stats.max_size = 1;
  return stats;
}

} // namespace hivestate::db::memory
