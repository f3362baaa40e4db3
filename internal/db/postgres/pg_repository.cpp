#include "pg_repository.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace hivestate::db::postgres {

namespace {

// Times cross the wire as unix milliseconds; 0 <-> NULL.
std::string MsOf(const char* column) {
  return std::string("COALESCE((EXTRACT(EPOCH FROM ") + column + ")*1000)::bigint,0)";
}

std::string TsOf(int param) {
  const std::string p = "$" + std::to_string(param) + "::bigint";
  return "CASE WHEN " + p + "=0 THEN NULL ELSE to_timestamp(" + p + "/1000.0) END";
}

const std::string& AgentSelect() {
  static const std::string sql = "SELECT agent_id,status,COALESCE(current_task_id,''),context_usage," + MsOf("last_activity") +
                                 ",capabilities::text,performance_metrics::text," + MsOf("created_at") + "," +
                                 MsOf("updated_at") + " FROM agents ";
  return sql;
}

const std::string& TaskSelect() {
  static const std::string sql = "SELECT task_id,status,COALESCE(agent_id,''),priority," + MsOf("created_at") + "," +
                                 MsOf("started_at") + "," + MsOf("completed_at") +
                                 ",metadata::text,COALESCE(result::text,''),created_seq FROM tasks ";
  return sql;
}

const std::string& SnapshotSelect() {
  static const std::string sql = "SELECT id," + MsOf("timestamp") +
                                 ",total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,"
                                 "average_context_usage,quality_score,metadata::text FROM system_snapshots ";
  return sql;
}

std::string Text(hivestate::state::v1::AgentStatus s) {
  return std::string(hivestate::model::AgentStatusName(s));
}

std::string Text(hivestate::state::v1::TaskStatus s) {
  return std::string(hivestate::model::TaskStatusName(s));
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::AgentRecord ReadAgent(const pqxx::row& row) {
  model::AgentRecord r;
  r.agent_id                 = row[0].c_str();
  r.status                   = hivestate::model::ParseAgentStatus(row[1].c_str()).value_or(hivestate::state::v1::AGENT_STATUS_UNSPECIFIED);
  r.current_task_id          = row[2].c_str();
  r.context_usage            = row[3].as<double>();
  r.last_activity_ms         = row[4].as<uint64_t>();
  r.capabilities_json        = row[5].c_str();
  r.performance_metrics_json = row[6].c_str();
  r.created_at_ms            = row[7].as<uint64_t>();
  r.updated_at_ms            = row[8].as<uint64_t>();
  return r;
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.task_id         = row[0].c_str();
  r.status          = hivestate::model::ParseTaskStatus(row[1].c_str()).value_or(hivestate::state::v1::TASK_STATUS_UNSPECIFIED);
  r.agent_id        = row[2].c_str();
  r.priority        = row[3].as<int32_t>();
  r.created_at_ms   = row[4].as<uint64_t>();
  r.started_at_ms   = row[5].as<uint64_t>();
  r.completed_at_ms = row[6].as<uint64_t>();
  r.metadata_json   = row[7].c_str();
  r.result_json     = row[8].c_str();
  r.created_seq     = row[9].as<uint64_t>();
  return r;
}

model::SnapshotRecord ReadSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.id                    = row[0].as<uint64_t>();
  r.timestamp_ms          = row[1].as<uint64_t>();
  r.total_agents          = row[2].as<int64_t>();
  r.active_agents         = row[3].as<int64_t>();
  r.total_tasks           = row[4].as<int64_t>();
  r.completed_tasks       = row[5].as<int64_t>();
  r.failed_tasks          = row[6].as<int64_t>();
  r.average_context_usage = row[7].as<double>();
  r.quality_score         = row[8].as<double>();
  r.metadata_json         = row[9].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return TranslateError(e).ToResult();
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result PgRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO agents(agent_id,status,current_task_id,context_usage,last_activity,capabilities,performance_metrics) "
        "VALUES($1,$2,$3,$4," + TsOf(5) + ",$6::jsonb,$7::jsonb) "
        "ON CONFLICT(agent_id) DO UPDATE SET capabilities=EXCLUDED.capabilities, last_activity=EXCLUDED.last_activity;",
        r.agent_id, Text(r.status), NullIfEmpty(r.current_task_id), r.context_usage, r.last_activity_ms,
        r.capabilities_json, r.performance_metrics_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AgentRecord> PgRepository::GetAgent(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_agent", id);
    if (res.empty()) return std::nullopt;
    return ReadAgent(res[0]);
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

Result PgRepository::PatchAgent(Transaction& t, const model::AgentPatch& p) {
  try {
    std::optional<std::string> status;
    if (p.status) status = Text(*p.status);

    auto res = TX(t).Work().exec_params(
        "UPDATE agents SET status=COALESCE($2,status),"
        " current_task_id=CASE WHEN $3 THEN NULL ELSE COALESCE($4,current_task_id) END,"
        " context_usage=COALESCE($5,context_usage),"
        " performance_metrics=COALESCE($6::jsonb,performance_metrics),"
        " last_activity=to_timestamp($7::bigint/1000.0) "
        "WHERE agent_id=$1;",
        p.agent_id, status, p.clear_current_task, p.current_task_id, p.context_usage, p.performance_metrics_json, p.at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "agent not found: " + p.agent_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AgentRecord> PgRepository::ListActiveAgents(Transaction& t, uint64_t since_ms) {
  try {
    auto res = TX(t).Work().exec_params(AgentSelect() +
                                            "WHERE status IN ('idle','busy') AND last_activity >= to_timestamp($1::bigint/1000.0) "
                                            "ORDER BY last_activity DESC;",
                                        since_ms);
    std::vector<model::AgentRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadAgent(row));
    return out;
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

uint64_t PgRepository::CountAgents(Transaction& t, const std::string& exclude_prefix) {
  try {
    auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM agents WHERE $1 = '' OR left(agent_id, length($1)) <> $1;", exclude_prefix);
    return res[0][0].as<uint64_t>();
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

Result PgRepository::ReleaseAgentTask(Transaction& t, const std::string& agent_id, const std::string& task_id, uint64_t at_ms) {
  try {
    TX(t).Work().exec_params(
        "UPDATE agents SET current_task_id=NULL, status='idle', last_activity=to_timestamp($3::bigint/1000.0) "
        "WHERE agent_id=$1 AND current_task_id=$2;",
        agent_id, task_id, at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  try {
    const uint64_t created = r.created_at_ms == 0 ? util::NowMillis() : r.created_at_ms;
    auto           res     = TX(t).Work().exec_params(
        "INSERT INTO tasks(task_id,status,agent_id,priority,created_at,started_at,completed_at,metadata,result) "
        "VALUES(COALESCE($1,gen_random_uuid()::text),$2,$3,$4," + TsOf(5) + "," + TsOf(6) + "," + TsOf(7) + ",$8::jsonb,$9::jsonb) "
        "RETURNING task_id, created_seq;",
        NullIfEmpty(r.task_id), Text(r.status), NullIfEmpty(r.agent_id), r.priority, created, r.started_at_ms,
        r.completed_at_ms, r.metadata_json, NullIfEmpty(r.result_json));
    r.task_id       = res[0][0].c_str();
    r.created_seq   = res[0][1].as<uint64_t>();
    r.created_at_ms = created;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params(TaskSelect() + "WHERE task_id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadTask(res[0]);
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

std::vector<model::TaskRecord> PgRepository::ListPendingTasks(Transaction& t, uint64_t limit) {
  try {
    auto                           res = TX(t).Work().exec_prepared("pending_tasks", limit);
    std::vector<model::TaskRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadTask(row));
    return out;
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

Result PgRepository::AssignTask(Transaction& t, const std::string& task_id, const std::string& agent_id, uint64_t at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("assign_task", task_id, agent_id, at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "task not pending: " + task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TransitionTask(Transaction& t, const model::TaskTransition& tr) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params(
        "UPDATE tasks SET status=$4, result=COALESCE($5::jsonb,result),"
        " completed_at=CASE WHEN $6 THEN to_timestamp($7::bigint/1000.0) ELSE completed_at END "
        "WHERE task_id=$1 AND status IN ($2,$3);",
        tr.task_id, Text(tr.from_a), Text(tr.from_b), Text(tr.to), tr.result_json, tr.set_completed_at, tr.at_ms);
    if (res.affected_rows() == 0) {
      auto exists = work.exec_params("SELECT 1 FROM tasks WHERE task_id=$1;", tr.task_id);
      if (exists.empty()) return Result::Err(ErrorCode::NotFound, "task not found: " + tr.task_id);
      return Result::Err(ErrorCode::Conflict, "task status changed: " + tr.task_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Snapshots / checkpoints
// ------------------------------------------------------------------

Result PgRepository::InsertComputedSnapshot(Transaction& t, uint64_t at_ms) {
  try {
    TX(t).Work().exec_params(
        "WITH agent_stats AS ("
        "  SELECT COUNT(*) AS total_agents,"
        "         COUNT(*) FILTER (WHERE status IN ('idle','busy')) AS active_agents,"
        "         COALESCE(AVG(context_usage),0.0) AS avg_context_usage FROM agents),"
        " task_stats AS ("
        "  SELECT COUNT(*) AS total_tasks,"
        "         COUNT(*) FILTER (WHERE status='completed') AS completed_tasks,"
        "         COUNT(*) FILTER (WHERE status='failed') AS failed_tasks FROM tasks) "
        "INSERT INTO system_snapshots(timestamp,total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,average_context_usage) "
        "SELECT to_timestamp($1::bigint/1000.0), a.total_agents, a.active_agents, t.total_tasks, t.completed_tasks, t.failed_tasks, a.avg_context_usage "
        "FROM agent_stats a, task_stats t;",
        at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO system_snapshots(timestamp,total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,"
        "average_context_usage,quality_score,metadata) "
        "VALUES(to_timestamp($1::bigint/1000.0),$2,$3,$4,$5,$6,$7,$8,$9::jsonb) RETURNING id;",
        r.timestamp_ms, r.total_agents, r.active_agents, r.total_tasks, r.completed_tasks, r.failed_tasks,
        r.average_context_usage, r.quality_score, r.metadata_json);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshots(Transaction& t, uint64_t since_ms, uint64_t limit) {
  try {
    auto res = TX(t).Work().exec_params(SnapshotSelect() +
                                            "WHERE timestamp >= to_timestamp($1::bigint/1000.0) "
                                            "ORDER BY timestamp DESC, id DESC LIMIT $2;",
                                        since_ms, limit);
    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadSnapshot(row));
    return out;
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

Result PgRepository::InsertCheckpoint(Transaction& t, model::CheckpointRecord& r) {
  try {
    if (r.timestamp_ms == 0) r.timestamp_ms = util::NowMillis();
    auto res = TX(t).Work().exec_params(
        "INSERT INTO checkpoints(checkpoint_name,timestamp,data) VALUES($1,to_timestamp($2::bigint/1000.0),$3::jsonb) RETURNING id;",
        r.name, r.timestamp_ms, r.data_json);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpoints(Transaction& t, const model::CheckpointQuery& q) {
  try {
    auto res = TX(t).Work().exec_params(
        "SELECT id,checkpoint_name," + MsOf("timestamp") + ",data::text FROM checkpoints "
        "WHERE ($1::text IS NULL OR checkpoint_name=$1) "
        "AND ($2::bigint IS NULL OR timestamp >= to_timestamp($2::bigint/1000.0)) "
        "AND ($3::bigint IS NULL OR timestamp <= to_timestamp($3::bigint/1000.0)) "
        "ORDER BY timestamp DESC, id DESC LIMIT $4;",
        q.name, q.since_ms, q.until_ms, q.limit);

    std::vector<model::CheckpointRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::CheckpointRecord r;
      r.id           = row[0].as<uint64_t>();
      r.name         = row[1].c_str();
      r.timestamp_ms = row[2].as<uint64_t>();
      r.data_json    = row[3].c_str();
      out.push_back(std::move(r));
    }
    return out;
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

void PgRepository::Probe(Transaction& t) {
  try {
    TX(t).Work().exec("SELECT 1;");
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

PoolStats PgRepository::Stats() const {
  return pool_->Stats();
}

} // namespace hivestate::db::postgres
