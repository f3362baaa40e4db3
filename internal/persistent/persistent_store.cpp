#include "persistent_store.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "record_mapping.hpp"

namespace hivestate::persistent {

using hivestate::observability::IntField;
using hivestate::observability::StringField;
using util::ErrorCode;
using util::FailWith;
using util::StatusOf;
using util::Result;
using util::ValueResult;

namespace {

// Outcomes a caller is expected to handle; not worth an error line.
bool IsExpected(ErrorCode code) {
  return code == ErrorCode::NotFound || code == ErrorCode::Conflict || code == ErrorCode::AlreadyExists ||
         code == ErrorCode::InvalidArgument;
}

ValueResult<db::model::AgentPatch> ToPatch(const v1::AgentUpdate& update, uint64_t at_ms) {
  using PatchResult = ValueResult<db::model::AgentPatch>;
  if (update.agent_id().empty()) {
    return PatchResult::Err(ErrorCode::InvalidArgument, "agent_id is required");
  }

  db::model::AgentPatch patch;
  patch.agent_id = update.agent_id();
  patch.at_ms    = at_ms;

  if (update.has_status()) {
    if (update.status() == v1::AGENT_STATUS_UNSPECIFIED) {
      return PatchResult::Err(ErrorCode::InvalidArgument, "agent status unspecified");
    }
    patch.status = update.status();
  }
  if (update.clear_current_task()) {
    patch.clear_current_task = true;
  } else if (update.has_current_task_id()) {
    patch.current_task_id = update.current_task_id();
  }
  if (update.has_context_usage()) {
    const double usage = update.context_usage();
    if (usage < 0.0 || usage > 1.0) {
      return PatchResult::Err(ErrorCode::InvalidArgument, "context_usage out of range [0,1]");
    }
    patch.context_usage = usage;
  }
  if (update.has_performance_metrics()) {
    try {
      patch.performance_metrics_json = MetricsToJson(update.performance_metrics().values());
    } catch (const util::StoreError& e) {
      return PatchResult::Err(e.ToResult());
    }
  }
  return PatchResult::Ok(std::move(patch));
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

PersistentStore::PersistentStore(std::shared_ptr<db::Repository> repo, int serialization_retries)
    : repo_(std::move(repo)), serialization_retries_(serialization_retries < 0 ? 0 : serialization_retries) {
  if (!repo_) {
    throw std::invalid_argument("PersistentStore: repository is null");
  }
}

template <typename Fn>
auto PersistentStore::Run(std::string_view op, Fn&& fn) {
  using R = std::invoke_result_t<Fn&, db::Transaction&>;

  for (int attempt = 0;; ++attempt) {
    Result failure;
    try {
      auto tx  = repo_->Begin();
      R    out = fn(*tx);

      const Result& status = StatusOf(out);
      if (status) {
        tx->Commit();
        return out;
      }
      tx->Rollback();
      if (status.code != ErrorCode::SerializationFailure) {
        if (!IsExpected(status.code)) {
          HIVESTATE_LOG_ERROR("Persistent operation failed", {StringField("op", op), StringField("code", util::ToString(status.code)),
                                                              StringField("error", status.message)});
        }
        return out;
      }
      failure = status;
    } catch (const util::StoreError& e) {
      failure = e.ToResult();
    } catch (const std::exception& e) {
      failure = Result::Err(ErrorCode::InternalError, e.what());
    }

    if (failure.code == ErrorCode::SerializationFailure && attempt < serialization_retries_) {
      HIVESTATE_LOG_DEBUG("Retrying after serialization failure", {StringField("op", op), IntField("attempt", attempt + 1)});
      continue;
    }
    HIVESTATE_LOG_ERROR("Persistent operation failed", {StringField("op", op), StringField("code", util::ToString(failure.code)),
                                                        StringField("error", failure.message)});
    return FailWith<R>(std::move(failure));
  }
}

// ---------------------------------------------------------------------
// Agents
// ---------------------------------------------------------------------

Result PersistentStore::RegisterAgent(const std::string& agent_id, const std::vector<std::string>& capabilities) {
  if (agent_id.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "agent_id is required");
  }

  db::model::AgentRecord record;
  record.agent_id          = agent_id;
  record.last_activity_ms  = util::NowMillis();
  record.capabilities_json = CapabilitiesToJson(capabilities);

  return Run("RegisterAgent", [&](db::Transaction& tx) { return repo_->UpsertAgent(tx, record); });
}

ValueResult<std::optional<v1::Agent>> PersistentStore::GetAgentState(const std::string& agent_id) {
  return Run("GetAgentState", [&](db::Transaction& tx) {
    auto record = repo_->GetAgent(tx, agent_id);
    if (!record) {
      return ValueResult<std::optional<v1::Agent>>::Ok(std::nullopt);
    }
    return ValueResult<std::optional<v1::Agent>>::Ok(ToAgent(*record));
  });
}

Result PersistentStore::UpdateAgentState(const v1::AgentUpdate& update) {
  auto patch = ToPatch(update, util::NowMillis());
  if (!patch) {
    return patch.status;
  }
  return Run("UpdateAgentState", [&](db::Transaction& tx) { return repo_->PatchAgent(tx, patch.value); });
}

Result PersistentStore::RemoveAgent(const std::string& agent_id) {
  db::model::AgentPatch patch;
  patch.agent_id = agent_id;
  patch.status   = v1::AGENT_STATUS_OFFLINE;
  patch.at_ms    = util::NowMillis();
  return Run("RemoveAgent", [&](db::Transaction& tx) { return repo_->PatchAgent(tx, patch); });
}

ValueResult<std::vector<v1::Agent>> PersistentStore::GetActiveAgents() {
  const uint64_t now   = util::NowMillis();
  const uint64_t since = now - static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(kActiveWindow).count());

  return Run("GetActiveAgents", [&](db::Transaction& tx) {
    std::vector<v1::Agent> agents;
    for (const auto& record : repo_->ListActiveAgents(tx, since)) {
      agents.push_back(ToAgent(record));
    }
    return ValueResult<std::vector<v1::Agent>>::Ok(std::move(agents));
  });
}

ValueResult<uint64_t> PersistentStore::BatchUpdateAgents(const std::vector<v1::AgentUpdate>& updates) {
  const uint64_t                     now = util::NowMillis();
  std::vector<db::model::AgentPatch> patches;
  patches.reserve(updates.size());
  for (const auto& update : updates) {
    auto patch = ToPatch(update, now);
    if (!patch) {
      return ValueResult<uint64_t>::Err(patch.status);
    }
    patches.push_back(std::move(patch.value));
  }

  return Run("BatchUpdateAgents", [&](db::Transaction& tx) {
    uint64_t updated = 0;
    for (const auto& patch : patches) {
      auto r = repo_->PatchAgent(tx, patch);
      if (r) {
        ++updated;
      } else if (r.code != ErrorCode::NotFound) {
        return ValueResult<uint64_t>::Err(std::move(r));
      }
    }
    return ValueResult<uint64_t>::Ok(updated);
  });
}

// ---------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------

ValueResult<std::string> PersistentStore::CreateTask(const v1::NewTask& task) {
  if (task.has_status() && task.status() != v1::TASK_STATUS_PENDING) {
    return ValueResult<std::string>::Err(ErrorCode::InvalidArgument, "new tasks start pending");
  }
  const uint64_t now = util::NowMillis();

  return Run("CreateTask", [&](db::Transaction& tx) {
    auto record            = ToTaskRecord(task);
    record.created_at_ms   = now;
    record.started_at_ms   = 0;
    record.completed_at_ms = 0;

    auto r = repo_->InsertTask(tx, record);
    if (!r) {
      return ValueResult<std::string>::Err(std::move(r));
    }
    return ValueResult<std::string>::Ok(record.task_id);
  });
}

ValueResult<std::optional<v1::Task>> PersistentStore::GetTask(const std::string& task_id) {
  return Run("GetTask", [&](db::Transaction& tx) {
    auto record = repo_->GetTask(tx, task_id);
    if (!record) {
      return ValueResult<std::optional<v1::Task>>::Ok(std::nullopt);
    }
    return ValueResult<std::optional<v1::Task>>::Ok(ToTask(*record));
  });
}

ValueResult<std::vector<v1::Task>> PersistentStore::GetPendingTasks(std::size_t limit) {
  return Run("GetPendingTasks", [&](db::Transaction& tx) {
    std::vector<v1::Task> tasks;
    for (const auto& record : repo_->ListPendingTasks(tx, limit)) {
      tasks.push_back(ToTask(record));
    }
    return ValueResult<std::vector<v1::Task>>::Ok(std::move(tasks));
  });
}

Result PersistentStore::AssignTask(const std::string& task_id, const std::string& agent_id) {
  const uint64_t now = util::NowMillis();

  return Run("AssignTask", [&](db::Transaction& tx) {
    if (!repo_->GetAgent(tx, agent_id)) {
      return Result::Err(ErrorCode::NotFound, "agent not found: " + agent_id);
    }

    // Conditional on status=pending; a lost race comes back as Conflict.
    auto r = repo_->AssignTask(tx, task_id, agent_id, now);
    if (!r) {
      return r;
    }

    db::model::AgentPatch patch;
    patch.agent_id        = agent_id;
    patch.status          = v1::AGENT_STATUS_BUSY;
    patch.current_task_id = task_id;
    patch.at_ms           = now;
    return repo_->PatchAgent(tx, patch);
  });
}

Result PersistentStore::StartTask(const std::string& task_id) {
  db::model::TaskTransition transition;
  transition.task_id = task_id;
  transition.from_a  = v1::TASK_STATUS_ASSIGNED;
  transition.from_b  = v1::TASK_STATUS_ASSIGNED;
  transition.to      = v1::TASK_STATUS_IN_PROGRESS;
  transition.at_ms   = util::NowMillis();

  return Run("StartTask", [&](db::Transaction& tx) { return repo_->TransitionTask(tx, transition); });
}

Result PersistentStore::FinishTask(const std::string& task_id, v1::TaskStatus final_status,
                                   const std::optional<google::protobuf::Value>& result) {
  if (!model::IsTerminal(final_status)) {
    return Result::Err(ErrorCode::InvalidArgument, "final status must be completed or failed");
  }

  db::model::TaskTransition transition;
  transition.task_id          = task_id;
  transition.from_a           = v1::TASK_STATUS_ASSIGNED;
  transition.from_b           = v1::TASK_STATUS_IN_PROGRESS;
  transition.to               = final_status;
  transition.set_completed_at = true;
  transition.at_ms            = util::NowMillis();

  return Run("FinishTask", [&](db::Transaction& tx) {
    if (result) {
      transition.result_json = util::ToJson(*result);
    }
    auto task = repo_->GetTask(tx, task_id);
    if (!task) {
      return Result::Err(ErrorCode::NotFound, "task not found: " + task_id);
    }

    auto r = repo_->TransitionTask(tx, transition);
    if (!r || task->agent_id.empty()) {
      return r;
    }
    return repo_->ReleaseAgentTask(tx, task->agent_id, task_id, transition.at_ms);
  });
}

// ---------------------------------------------------------------------
// System records
// ---------------------------------------------------------------------

Result PersistentStore::CreateSystemSnapshot() {
  const uint64_t now = util::NowMillis();
  return Run("CreateSystemSnapshot", [&](db::Transaction& tx) { return repo_->InsertComputedSnapshot(tx, now); });
}

ValueResult<uint64_t> PersistentStore::CreateCheckpoint(const std::string& name, const google::protobuf::Struct& data) {
  const auto now = util::Now();

  db::model::CheckpointRecord record;
  record.name         = name.empty() ? "checkpoint_" + util::ToIso8601(now) : name;
  record.timestamp_ms = util::ToUnixMillis(now);

  return Run("CreateCheckpoint", [&](db::Transaction& tx) {
    record.data_json = util::ToJson(data);
    auto r = repo_->InsertCheckpoint(tx, record);
    if (!r) {
      return ValueResult<uint64_t>::Err(std::move(r));
    }
    return ValueResult<uint64_t>::Ok(record.id);
  });
}

ValueResult<std::string> PersistentStore::ImportTask(const v1::NewTask& task) {
  if (task.task_id().empty()) {
    return ValueResult<std::string>::Err(ErrorCode::InvalidArgument, "imported task needs an id");
  }
  return Run("ImportTask", [&](db::Transaction& tx) {
    auto record = ToTaskRecord(task);
    auto r      = repo_->InsertTask(tx, record);
    if (!r && r.code != ErrorCode::AlreadyExists) {
      return ValueResult<std::string>::Err(std::move(r));
    }
    return ValueResult<std::string>::Ok(record.task_id);
  });
}

Result PersistentStore::ImportSnapshot(const v1::SystemSnapshot& snapshot) {
  const uint64_t now = util::NowMillis();
  return Run("ImportSnapshot", [&](db::Transaction& tx) {
    auto record = ToSnapshotRecord(snapshot);
    if (record.timestamp_ms == 0) {
      record.timestamp_ms = now;
    }
    return repo_->InsertSnapshot(tx, record);
  });
}

ValueResult<std::vector<v1::Checkpoint>> PersistentStore::GetCheckpoints(const db::model::CheckpointQuery& query) {
  return Run("GetCheckpoints", [&](db::Transaction& tx) {
    std::vector<v1::Checkpoint> checkpoints;
    for (const auto& record : repo_->ListCheckpoints(tx, query)) {
      checkpoints.push_back(ToCheckpoint(record));
    }
    return ValueResult<std::vector<v1::Checkpoint>>::Ok(std::move(checkpoints));
  });
}

ValueResult<std::vector<v1::SystemSnapshot>> PersistentStore::GetRecentSnapshots(util::TimePoint since, std::size_t limit) {
  const uint64_t since_ms = util::ToUnixMillis(since);
  return Run("GetRecentSnapshots", [&](db::Transaction& tx) {
    std::vector<v1::SystemSnapshot> snapshots;
    for (const auto& record : repo_->ListSnapshots(tx, since_ms, limit)) {
      snapshots.push_back(ToSnapshot(record));
    }
    return ValueResult<std::vector<v1::SystemSnapshot>>::Ok(std::move(snapshots));
  });
}

ValueResult<uint64_t> PersistentStore::CountAgents(const std::string& exclude_prefix) {
  return Run("CountAgents", [&](db::Transaction& tx) { return ValueResult<uint64_t>::Ok(repo_->CountAgents(tx, exclude_prefix)); });
}

// ---------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------

PersistentHealth PersistentStore::HealthCheck() {
  PersistentHealth health;
  try {
    const auto acquire_started = std::chrono::steady_clock::now();
    auto       tx              = repo_->Begin();
    health.acquire_ms          = ElapsedMs(acquire_started);

    const auto query_started = std::chrono::steady_clock::now();
    repo_->Probe(*tx);
    health.sample_query_ms = ElapsedMs(query_started);

    tx->Commit();
    health.connected = true;
  } catch (const std::exception& e) {
    health.error = e.what();
    HIVESTATE_LOG_WARN("Persistent store health check failed", {StringField("error", e.what())});
  }
  health.pool = repo_->Stats();
  return health;
}

} // namespace hivestate::persistent
