#include "migrator.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace hivestate::migration {

namespace v1 = hivestate::state::v1;

using hivestate::observability::BoolField;
using hivestate::observability::DoubleField;
using hivestate::observability::IntField;
using hivestate::observability::StringField;
using util::ErrorCode;
using util::ValueResult;

namespace {

constexpr const char* kSourceValidation     = "source_validation";
constexpr const char* kInfrastructureSetup  = "infrastructure_setup";
constexpr const char* kAgentMigration       = "agent_migration";
constexpr const char* kTaskMigration        = "task_migration";
constexpr const char* kSystemDataMigration  = "system_data_migration";
constexpr const char* kValidation           = "validation";

// Measures a phase from construction to Finish().
class PhaseScope {
 public:
  PhaseScope(const char* name, bool rollback_available) : started_(std::chrono::steady_clock::now()) {
    result_.phase              = name;
    result_.rollback_available = rollback_available;
    HIVESTATE_LOG_INFO("Migration phase started", {StringField("phase", name)});
  }

  PhaseResult& result() {
    return result_;
  }

  void Error(std::string message) {
    HIVESTATE_LOG_WARN("Migration error", {StringField("phase", result_.phase), StringField("error", message)});
    result_.errors.push_back(std::move(message));
  }

  PhaseResult Finish() {
    result_.duration          = std::chrono::steady_clock::now() - started_;
    result_.success           = result_.errors.empty();
    result_.validation_passed = result_.errors.empty();
    HIVESTATE_LOG_INFO("Migration phase finished", {StringField("phase", result_.phase), BoolField("success", result_.success),
                                                    IntField("records", static_cast<int64_t>(result_.records_migrated)),
                                                    IntField("errors", static_cast<int64_t>(result_.errors.size()))});
    return std::move(result_);
  }

 private:
  std::chrono::steady_clock::time_point started_;
  PhaseResult                           result_;
};

struct ConvertedAgent {
  std::vector<std::string> capabilities;
  v1::AgentUpdate          update;
  bool                     has_update = false;
};

ValueResult<ConvertedAgent> ConvertAgent(const LegacyAgent& row) {
  using R = ValueResult<ConvertedAgent>;
  if (row.agent_id.empty()) {
    return R::Err(ErrorCode::InvalidArgument, "empty agent_id");
  }

  ConvertedAgent out;
  out.update.set_agent_id(row.agent_id);

  if (!row.capabilities.empty()) {
    google::protobuf::ListValue list;
    if (!util::FromJson(row.capabilities, &list)) {
      return R::Err(ErrorCode::Corruption, "capabilities is not a JSON array");
    }
    for (const auto& value : list.values()) {
      out.capabilities.push_back(value.kind_case() == google::protobuf::Value::kStringValue ? value.string_value()
                                                                                          : util::ValueToFlatString(value));
    }
  }

  auto status = model::ParseAgentStatus(row.status.empty() ? "idle" : row.status);
  if (!status) {
    return R::Err(ErrorCode::InvalidArgument, "unknown agent status '" + row.status + "'");
  }
  if (*status != v1::AGENT_STATUS_IDLE) {
    out.update.set_status(*status);
    out.has_update = true;
  }

  if (row.context_usage && *row.context_usage != 0.0) {
    if (*row.context_usage < 0.0 || *row.context_usage > 1.0) {
      return R::Err(ErrorCode::InvalidArgument, "context_usage out of range");
    }
    out.update.set_context_usage(*row.context_usage);
    out.has_update = true;
  }

  if (!row.current_task_id.empty()) {
    out.update.set_current_task_id(row.current_task_id);
    out.has_update = true;
  }

  if (!row.performance_metrics.empty()) {
    google::protobuf::Struct metrics;
    if (!util::FromJson(row.performance_metrics, &metrics)) {
      return R::Err(ErrorCode::Corruption, "performance_metrics is not a JSON object");
    }
    auto* values = out.update.mutable_performance_metrics()->mutable_values();
    for (const auto& [name, value] : metrics.fields()) {
      if (value.kind_case() == google::protobuf::Value::kNumberValue) {
        (*values)[name] = value.number_value();
      }
    }
    if (!values->empty()) {
      out.has_update = true;
    } else {
      out.update.clear_performance_metrics();
    }
  }
  return R::Ok(std::move(out));
}

ValueResult<v1::NewTask> ConvertTask(const LegacyTask& row) {
  using R = ValueResult<v1::NewTask>;
  if (row.task_id.empty()) {
    return R::Err(ErrorCode::InvalidArgument, "empty task_id");
  }

  v1::NewTask task;
  task.set_task_id(row.task_id);

  auto status = model::ParseTaskStatus(row.status.empty() ? "pending" : row.status);
  if (!status) {
    return R::Err(ErrorCode::InvalidArgument, "unknown task status '" + row.status + "'");
  }
  task.set_status(*status);
  task.set_priority(row.priority.value_or(5));
  task.set_agent_id(row.agent_id);

  const std::pair<const std::string*, google::protobuf::Timestamp*> times[] = {
      {&row.created_at, task.mutable_created_at()},
      {&row.started_at, task.mutable_started_at()},
      {&row.completed_at, task.mutable_completed_at()},
  };
  for (const auto& [text, out] : times) {
    uint64_t ms = 0;
    if (!ParseLegacyTime(*text, &ms)) {
      return R::Err(ErrorCode::InvalidArgument, "unreadable timestamp '" + *text + "'");
    }
    *out = util::MillisToProto(ms);
  }
  if (!row.metadata.empty() && !util::FromJson(row.metadata, task.mutable_metadata())) {
    return R::Err(ErrorCode::Corruption, "metadata is not a JSON object");
  }
  return R::Ok(std::move(task));
}

std::string RowError(const char* kind, const std::string& id, const util::Result& r) {
  return std::string(kind) + " " + id + ": " + r.message;
}

} // namespace

Migrator::Migrator(config::MigrationSettings settings, std::shared_ptr<orchestrator::HybridOrchestrator> target)
    : settings_(std::move(settings)), target_(std::move(target)) {
  if (!target_) {
    throw std::invalid_argument("Migrator: target orchestrator is required");
  }
  if (settings_.batch_size == 0) {
    settings_.batch_size = 1000;
  }
}

MigrationReport Migrator::Run() {
  const auto started = std::chrono::steady_clock::now();

  MigrationReport report;
  report.phase = "complete";

  auto record = [&](PhaseResult phase) -> const PhaseResult& {
    report.total_records += phase.records_migrated;
    report.errors.insert(report.errors.end(), phase.errors.begin(), phase.errors.end());
    report.rollback_available = phase.rollback_available;
    report.phases.push_back(std::move(phase));
    return report.phases.back();
  };
  auto halt = [&](const PhaseResult& phase) {
    report.success  = false;
    report.phase    = phase.phase;
    report.duration = std::chrono::steady_clock::now() - started;
    HIVESTATE_LOG_ERROR("Migration halted", {StringField("phase", phase.phase)});
    return report;
  };

  HIVESTATE_LOG_INFO("Migration started", {StringField("legacy_db", settings_.legacy_db_path), BoolField("dry_run", settings_.dry_run),
                                           IntField("batch_size", static_cast<int64_t>(settings_.batch_size))});

  if (const auto& source = record(ValidateSource()); !source.success) {
    return halt(source);
  }
  if (const auto& infra = record(SetupInfrastructure()); !infra.success) {
    return halt(infra);
  }

  const auto& agents = record(MigrateAgents());
  if (!agents.success && settings_.fail_fast) {
    return halt(agents);
  }
  const uint64_t agents_migrated = agents.records_migrated;

  if (const auto& tasks = record(MigrateTasks()); !tasks.success && settings_.fail_fast) {
    return halt(tasks);
  }
  if (const auto& system = record(MigrateSystemData()); !system.success && settings_.fail_fast) {
    return halt(system);
  }

  const auto& validation   = record(Validate(agents_migrated));
  report.validation_passed = validation.validation_passed;
  report.success           = report.errors.empty() && validation.validation_passed;
  report.duration          = std::chrono::steady_clock::now() - started;

  HIVESTATE_LOG_INFO("Migration finished", {BoolField("success", report.success), IntField("records", static_cast<int64_t>(report.total_records)),
                                            IntField("errors", static_cast<int64_t>(report.errors.size())),
                                            DoubleField("duration_s", report.duration.count())});
  return report;
}

// ---------------------------------------------------------------------
// Phase 1
// ---------------------------------------------------------------------

PhaseResult Migrator::ValidateSource() {
  PhaseScope scope(kSourceValidation, false);
  try {
    if (!std::filesystem::exists(settings_.legacy_db_path)) {
      scope.Error("legacy database not found: " + settings_.legacy_db_path);
      return scope.Finish();
    }
    legacy_ = std::make_unique<LegacyDatabase>(settings_.legacy_db_path);

    const auto tables = legacy_->Tables();
    for (const char* required : LegacyDatabase::kRequiredTables) {
      if (std::find(tables.begin(), tables.end(), required) == tables.end()) {
        scope.Error(std::string("required table missing: ") + required);
        continue;
      }
      HIVESTATE_LOG_INFO("Legacy table", {StringField("table", required), IntField("rows", static_cast<int64_t>(legacy_->Count(required)))});
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("source validation failed: ") + e.what());
  }
  return scope.Finish();
}

// ---------------------------------------------------------------------
// Phase 2
// ---------------------------------------------------------------------

PhaseResult Migrator::SetupInfrastructure() {
  PhaseScope scope(kInfrastructureSetup, settings_.rollback_enabled);
  try {
    auto health = target_->HealthCheck();
    if (!health.persistent.connected) {
      scope.Error("persistent store unreachable: " + health.persistent.error);
    }
    if (!health.ephemeral) {
      scope.Error("ephemeral store not configured");
    } else if (!health.ephemeral->connected) {
      scope.Error("ephemeral store unreachable: " + health.ephemeral->error);
    }
    if (!scope.result().errors.empty() || settings_.dry_run) {
      return scope.Finish();
    }

    if (auto r = target_->Initialize(); !r) {
      scope.Error("orchestrator initialization failed: " + r.message);
      return scope.Finish();
    }

    google::protobuf::Struct data;
    auto&                    fields = *data.mutable_fields();
    fields["legacy_db_path"].set_string_value(settings_.legacy_db_path);
    auto& counts = *fields["source_counts"].mutable_struct_value()->mutable_fields();
    for (const char* table : LegacyDatabase::kRequiredTables) {
      counts[table].set_number_value(static_cast<double>(legacy_->Count(table)));
    }

    const auto name       = "pre_migration_" + util::ToIso8601(util::Now());
    auto       checkpoint = target_->CreateCheckpoint(name, data);
    if (!checkpoint.ok()) {
      scope.Error("pre-migration checkpoint failed: " + checkpoint.status.message);
    } else {
      HIVESTATE_LOG_INFO("Pre-migration checkpoint written", {StringField("name", name), IntField("id", static_cast<int64_t>(checkpoint.value))});
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("infrastructure setup failed: ") + e.what());
  }
  return scope.Finish();
}

// ---------------------------------------------------------------------
// Phase 3
// ---------------------------------------------------------------------

PhaseResult Migrator::MigrateAgents() {
  PhaseScope scope(kAgentMigration, settings_.rollback_enabled);
  auto&      result = scope.result();
  try {
    const uint64_t total = legacy_->Count("agents");
    HIVESTATE_LOG_INFO("Migrating agents", {IntField("total", static_cast<int64_t>(total))});

    bool stop = false;
    for (uint64_t offset = 0; offset < total && !stop; offset += settings_.batch_size) {
      const auto batch = legacy_->Agents(settings_.batch_size, offset);
      if (batch.empty()) {
        break;
      }

      for (const auto& row : batch) {
        auto converted = ConvertAgent(row);
        if (!converted.ok()) {
          scope.Error(RowError("agent", row.agent_id, converted.status));
        } else if (settings_.dry_run) {
          ++result.records_migrated;
        } else if (auto r = target_->RegisterAgent(row.agent_id, converted.value.capabilities); !r) {
          scope.Error(RowError("agent", row.agent_id, r));
        } else if (converted.value.has_update && !(r = target_->UpdateAgentState(converted.value.update))) {
          scope.Error(RowError("agent", row.agent_id, r));
        } else {
          ++result.records_migrated;
        }

        if (settings_.fail_fast && !result.errors.empty()) {
          stop = true;
          break;
        }
      }

      if ((offset / settings_.batch_size + 1) % 10 == 0) {
        HIVESTATE_LOG_INFO("Agent migration progress", {IntField("migrated", static_cast<int64_t>(result.records_migrated)),
                                                        IntField("total", static_cast<int64_t>(total))});
      }
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("agent migration failed: ") + e.what());
  }
  return scope.Finish();
}

// ---------------------------------------------------------------------
// Phase 4
// ---------------------------------------------------------------------

PhaseResult Migrator::MigrateTasks() {
  PhaseScope scope(kTaskMigration, settings_.rollback_enabled);
  auto&      result = scope.result();
  try {
    auto&          store = target_->Persistent();
    const uint64_t total = legacy_->Count("tasks");
    HIVESTATE_LOG_INFO("Migrating tasks", {IntField("total", static_cast<int64_t>(total))});

    bool stop = false;
    for (uint64_t offset = 0; offset < total && !stop; offset += settings_.batch_size) {
      const auto batch = legacy_->Tasks(settings_.batch_size, offset);
      if (batch.empty()) {
        break;
      }

      for (const auto& row : batch) {
        auto converted = ConvertTask(row);
        if (!converted.ok()) {
          scope.Error(RowError("task", row.task_id, converted.status));
        } else if (settings_.dry_run) {
          ++result.records_migrated;
        } else if (auto imported = store.ImportTask(converted.value); !imported.ok()) {
          scope.Error(RowError("task", row.task_id, imported.status));
        } else {
          ++result.records_migrated;

          // Pending work is read soon by schedulers; warm the cache.
          if (converted.value.status() == v1::TASK_STATUS_PENDING) {
            auto stored = store.GetTask(imported.value);
            if (stored.ok() && stored.value && !target_->CacheTask(*stored.value)) {
              HIVESTATE_LOG_DEBUG("Task cache warm skipped", {StringField("task_id", imported.value)});
            }
          }
        }

        if (settings_.fail_fast && !result.errors.empty()) {
          stop = true;
          break;
        }
      }

      if ((offset / settings_.batch_size + 1) % 10 == 0) {
        HIVESTATE_LOG_INFO("Task migration progress", {IntField("migrated", static_cast<int64_t>(result.records_migrated)),
                                                       IntField("total", static_cast<int64_t>(total))});
      }
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("task migration failed: ") + e.what());
  }
  return scope.Finish();
}

// ---------------------------------------------------------------------
// Phase 5
// ---------------------------------------------------------------------

PhaseResult Migrator::MigrateSystemData() {
  PhaseScope scope(kSystemDataMigration, settings_.rollback_enabled);
  auto&      result = scope.result();
  try {
    auto& store = target_->Persistent();

    const auto     retention = std::chrono::hours(24) * settings_.snapshot_retention_days;
    const uint64_t cutoff_ms = util::ToUnixMillis(util::Now() - retention);

    for (const auto& row : legacy_->Snapshots()) {
      uint64_t ts = 0;
      if (!ParseLegacyTime(row.timestamp, &ts)) {
        scope.Error("snapshot: unreadable timestamp '" + row.timestamp + "'");
      } else if (ts >= cutoff_ms) {
        v1::SystemSnapshot snapshot;
        *snapshot.mutable_timestamp() = util::MillisToProto(ts);
        snapshot.set_total_agents(row.total_agents);
        snapshot.set_active_agents(row.active_agents);
        snapshot.set_total_tasks(row.total_tasks);
        snapshot.set_completed_tasks(row.completed_tasks);
        snapshot.set_failed_tasks(row.failed_tasks);
        snapshot.set_average_context_usage(row.average_context_usage);
        snapshot.set_quality_score(row.quality_score);
        (*snapshot.mutable_metadata()->mutable_fields())["migrated_from_sqlite"].set_bool_value(true);

        if (settings_.dry_run) {
          ++result.records_migrated;
        } else if (auto r = store.ImportSnapshot(snapshot); !r) {
          scope.Error("snapshot " + row.timestamp + ": " + r.message);
        } else {
          ++result.records_migrated;
        }
      }
      if (settings_.fail_fast && !result.errors.empty()) {
        return scope.Finish();
      }
    }

    for (const auto& row : legacy_->RecentCheckpoints(settings_.checkpoint_limit)) {
      google::protobuf::Struct wrapped;
      auto&                    fields = *wrapped.mutable_fields();
      fields["name"].set_string_value(row.name);
      if (row.data.empty()) {
        fields["data"].mutable_struct_value();
      } else if (!util::ParseJsonValue(row.data, &fields["data"])) {
        fields["data"].set_string_value(row.data);
      }
      fields["migrated_from_sqlite"].set_bool_value(true);
      fields["original_timestamp"].set_string_value(row.timestamp);

      if (settings_.dry_run) {
        ++result.records_migrated;
      } else if (auto r = target_->CreateCheckpoint(row.name, wrapped); !r.ok()) {
        scope.Error("checkpoint " + row.name + ": " + r.status.message);
      } else {
        ++result.records_migrated;
      }
      if (settings_.fail_fast && !result.errors.empty()) {
        return scope.Finish();
      }
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("system data migration failed: ") + e.what());
  }
  return scope.Finish();
}

// ---------------------------------------------------------------------
// Phase 6
// ---------------------------------------------------------------------

PhaseResult Migrator::Validate(uint64_t agents_migrated) {
  PhaseScope scope(kValidation, settings_.rollback_enabled);
  try {
    const uint64_t source_agents = legacy_->Count("agents");
    const auto     sample        = legacy_->Agents(settings_.validation_sample_size, 0);

    if (settings_.dry_run) {
      if (source_agents != agents_migrated) {
        scope.Error("agent count mismatch: source=" + std::to_string(source_agents) + " would_migrate=" + std::to_string(agents_migrated));
      }
      for (const auto& row : sample) {
        if (auto converted = ConvertAgent(row); !converted.ok()) {
          scope.Error(RowError("sample agent", row.agent_id, converted.status));
        }
      }
      return scope.Finish();
    }

    auto& store = target_->Persistent();

    auto target_agents = store.CountAgents(kProbePrefix);
    if (!target_agents.ok()) {
      scope.Error("target agent count failed: " + target_agents.status.message);
    } else if (target_agents.value != source_agents) {
      scope.Error("agent count mismatch: source=" + std::to_string(source_agents) + " target=" + std::to_string(target_agents.value));
    }

    for (const auto& row : sample) {
      auto stored = store.GetAgentState(row.agent_id);
      if (!stored.ok()) {
        scope.Error(RowError("sample agent", row.agent_id, stored.status));
      } else if (!stored.value) {
        scope.Error("sample agent " + row.agent_id + ": missing in target");
      } else if (model::AgentStatusName(stored.value->status()) != (row.status.empty() ? "idle" : row.status)) {
        scope.Error("sample agent " + row.agent_id + ": status mismatch");
      }
    }

    // Round trip through the orchestrator with a throwaway agent.
    const std::string probe = std::string(kProbePrefix) + util::NewId();
    if (auto r = target_->RegisterAgent(probe, {"validation"}); !r) {
      scope.Error("probe register failed: " + r.message);
    } else {
      auto read = target_->GetAgentState(probe);
      if (!read.ok() || !read.value) {
        scope.Error("probe read failed");
      }
      if (auto removed = target_->RemoveAgent(probe); !removed) {
        scope.Error("probe removal failed: " + removed.message);
      }
    }
  } catch (const std::exception& e) {
    scope.Error(std::string("validation failed: ") + e.what());
  }
  return scope.Finish();
}

} // namespace hivestate::migration
