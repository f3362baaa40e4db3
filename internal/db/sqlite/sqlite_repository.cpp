#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace hivestate::db::sqlite {

using util::ErrorCode;
using util::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 = unset timestamp
void BindOptU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::string StatusText(hivestate::state::v1::AgentStatus s) {
  return std::string(hivestate::model::AgentStatusName(s));
}

std::string StatusText(hivestate::state::v1::TaskStatus s) {
  return std::string(hivestate::model::TaskStatusName(s));
}

constexpr const char* kAgentColumns =
    "agent_id,status,current_task_id,context_usage,last_activity,capabilities,performance_metrics,created_at,updated_at";

model::AgentRecord ReadAgent(sqlite3_stmt* st) {
  model::AgentRecord r;
  r.agent_id                 = ColText(st, 0);
  r.status                   = hivestate::model::ParseAgentStatus(ColText(st, 1)).value_or(hivestate::state::v1::AGENT_STATUS_UNSPECIFIED);
  r.current_task_id          = ColText(st, 2);
  r.context_usage            = ColDouble(st, 3);
  r.last_activity_ms         = ColU64(st, 4);
  r.capabilities_json        = ColText(st, 5);
  r.performance_metrics_json = ColText(st, 6);
  r.created_at_ms            = ColU64(st, 7);
  r.updated_at_ms            = ColU64(st, 8);
  return r;
}

constexpr const char* kTaskColumns =
    "task_id,status,agent_id,priority,created_at,started_at,completed_at,metadata,result,rowid";

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.task_id         = ColText(st, 0);
  r.status          = hivestate::model::ParseTaskStatus(ColText(st, 1)).value_or(hivestate::state::v1::TASK_STATUS_UNSPECIFIED);
  r.agent_id        = ColText(st, 2);
  r.priority        = ColI32(st, 3);
  r.created_at_ms   = ColU64(st, 4);
  r.started_at_ms   = ColU64(st, 5);
  r.completed_at_ms = ColU64(st, 6);
  r.metadata_json   = ColText(st, 7);
  r.result_json     = ColText(st, 8);
  r.created_seq     = ColU64(st, 9);
  return r;
}

constexpr const char* kSnapshotColumns =
    "id,timestamp,total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,average_context_usage,quality_score,metadata";

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.id                    = ColU64(st, 0);
  r.timestamp_ms          = ColU64(st, 1);
  r.total_agents          = sqlite3_column_int64(st, 2);
  r.active_agents         = sqlite3_column_int64(st, 3);
  r.total_tasks           = sqlite3_column_int64(st, 4);
  r.completed_tasks       = sqlite3_column_int64(st, 5);
  r.failed_tasks          = sqlite3_column_int64(st, 6);
  r.average_context_usage = ColDouble(st, 7);
  r.quality_score         = ColDouble(st, 8);
  r.metadata_json         = ColText(st, 9);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  const auto code = SqliteDB::CodeFor(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "INSERT INTO agents(agent_id,status,current_task_id,context_usage,last_activity,capabilities,performance_metrics,created_at,updated_at)"
           " VALUES(?,?,?,?,?,?,?,?,?)"
           " ON CONFLICT(agent_id) DO UPDATE SET capabilities=excluded.capabilities,"
           " last_activity=excluded.last_activity, updated_at=excluded.last_activity;");

  const uint64_t created = r.created_at_ms == 0 ? r.last_activity_ms : r.created_at_ms;
  BindText(st.get(), 1, r.agent_id);
  BindText(st.get(), 2, StatusText(r.status));
  BindOptText(st.get(), 3, r.current_task_id);
  BindDouble(st.get(), 4, r.context_usage);
  BindU64(st.get(), 5, r.last_activity_ms);
  BindText(st.get(), 6, r.capabilities_json);
  BindText(st.get(), 7, r.performance_metrics_json);
  BindU64(st.get(), 8, created);
  BindU64(st.get(), 9, created);

  return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::AgentRecord> SqliteRepository::GetAgent(Transaction& t, const std::string& id) {
  auto&       tx  = TX(t);
  std::string sql = std::string("SELECT ") + kAgentColumns + " FROM agents WHERE agent_id=?;";
  Stmt        st(tx.DB(), sql.c_str());
  BindText(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadAgent(st.get());
}

Result SqliteRepository::PatchAgent(Transaction& t, const model::AgentPatch& p) {
  auto& tx = TX(t);

  // ?3 = 1 clears current_task_id, otherwise COALESCE keeps it
  Stmt st(tx.DB(),
          "UPDATE agents SET"
          " status=COALESCE(?2,status),"
          " current_task_id=CASE WHEN ?3=1 THEN NULL ELSE COALESCE(?4,current_task_id) END,"
          " context_usage=COALESCE(?5,context_usage),"
          " performance_metrics=COALESCE(?6,performance_metrics),"
          " last_activity=?7, updated_at=?7"
          " WHERE agent_id=?1;");

  BindText(st.get(), 1, p.agent_id);
  if (p.status) {
    BindText(st.get(), 2, StatusText(*p.status));
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  BindI32(st.get(), 3, p.clear_current_task ? 1 : 0);
  if (p.current_task_id) {
    BindText(st.get(), 4, *p.current_task_id);
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  if (p.context_usage) {
    BindDouble(st.get(), 5, *p.context_usage);
  } else {
    sqlite3_bind_null(st.get(), 5);
  }
  if (p.performance_metrics_json) {
    BindText(st.get(), 6, *p.performance_metrics_json);
  } else {
    sqlite3_bind_null(st.get(), 6);
  }
  BindU64(st.get(), 7, p.at_ms);

  auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(tx.Handle()) == 0) return Result::Err(ErrorCode::NotFound, "agent not found: " + p.agent_id);
  return Result::Ok();
}

std::vector<model::AgentRecord> SqliteRepository::ListActiveAgents(Transaction& t, uint64_t since_ms) {
  auto&       tx  = TX(t);
  std::string sql = std::string("SELECT ") + kAgentColumns +
                    " FROM agents WHERE status IN ('idle','busy') AND last_activity>=?"
                    " ORDER BY last_activity DESC;";
  Stmt st(tx.DB(), sql.c_str());
  BindU64(st.get(), 1, since_ms);

  std::vector<model::AgentRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadAgent(st.get()));
  return out;
}

uint64_t SqliteRepository::CountAgents(Transaction& t, const std::string& exclude_prefix) {
  auto& tx = TX(t);
  // substr comparison avoids LIKE wildcards inside the prefix
  Stmt st(tx.DB(), "SELECT COUNT(*) FROM agents WHERE ?1='' OR substr(agent_id,1,length(?1))<>?1;");
  BindText(st.get(), 1, exclude_prefix);
  st.Step();
  return ColU64(st.get(), 0);
}

Result SqliteRepository::ReleaseAgentTask(Transaction& t, const std::string& agent_id, const std::string& task_id, uint64_t at_ms) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "UPDATE agents SET current_task_id=NULL, status='idle', last_activity=?3, updated_at=?3"
           " WHERE agent_id=?1 AND current_task_id=?2;");
  BindText(st.get(), 1, agent_id);
  BindText(st.get(), 2, task_id);
  BindU64(st.get(), 3, at_ms);
  return Translate(tx.Handle(), sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  auto& tx = TX(t);
  if (r.task_id.empty()) r.task_id = util::NewId();
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();

  Stmt st(tx.DB(),
          "INSERT INTO tasks(task_id,status,agent_id,priority,created_at,started_at,completed_at,metadata,result,updated_at)"
          " VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.task_id);
  BindText(st.get(), 2, StatusText(r.status));
  BindOptText(st.get(), 3, r.agent_id);
  BindI32(st.get(), 4, r.priority);
  BindU64(st.get(), 5, r.created_at_ms);
  BindOptU64(st.get(), 6, r.started_at_ms);
  BindOptU64(st.get(), 7, r.completed_at_ms);
  BindText(st.get(), 8, r.metadata_json);
  BindOptText(st.get(), 9, r.result_json);
  BindU64(st.get(), 10, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(tx.Handle()) == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.task_id);
  }
  auto result = Translate(tx.Handle(), rc);
  if (result) r.created_seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return result;
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
  auto&       tx  = TX(t);
  std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE task_id=?;";
  Stmt        st(tx.DB(), sql.c_str());
  BindText(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadTask(st.get());
}

std::vector<model::TaskRecord> SqliteRepository::ListPendingTasks(Transaction& t, uint64_t limit) {
  auto&       tx  = TX(t);
  std::string sql = std::string("SELECT ") + kTaskColumns +
                    " FROM tasks WHERE status='pending'"
                    " ORDER BY priority DESC, created_at ASC, rowid ASC LIMIT ?;";
  Stmt st(tx.DB(), sql.c_str());
  BindU64(st.get(), 1, limit);

  std::vector<model::TaskRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadTask(st.get()));
  return out;
}

Result SqliteRepository::AssignTask(Transaction& t, const std::string& task_id, const std::string& agent_id, uint64_t at_ms) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "UPDATE tasks SET agent_id=?2, status='assigned', started_at=?3, updated_at=?3"
           " WHERE task_id=?1 AND status='pending';");
  BindText(st.get(), 1, task_id);
  BindText(st.get(), 2, agent_id);
  BindU64(st.get(), 3, at_ms);

  auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(tx.Handle()) == 0) return Result::Err(ErrorCode::Conflict, "task not pending: " + task_id);
  return Result::Ok();
}

Result SqliteRepository::TransitionTask(Transaction& t, const model::TaskTransition& tr) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "UPDATE tasks SET status=?4,"
           " result=COALESCE(?5,result),"
           " completed_at=CASE WHEN ?6=1 THEN ?7 ELSE completed_at END,"
           " updated_at=?7"
           " WHERE task_id=?1 AND status IN (?2,?3);");
  BindText(st.get(), 1, tr.task_id);
  BindText(st.get(), 2, StatusText(tr.from_a));
  BindText(st.get(), 3, StatusText(tr.from_b));
  BindText(st.get(), 4, StatusText(tr.to));
  if (tr.result_json) {
    BindText(st.get(), 5, *tr.result_json);
  } else {
    sqlite3_bind_null(st.get(), 5);
  }
  BindI32(st.get(), 6, tr.set_completed_at ? 1 : 0);
  BindU64(st.get(), 7, tr.at_ms);

  auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(tx.Handle()) == 0) {
    if (!GetTask(t, tr.task_id)) return Result::Err(ErrorCode::NotFound, "task not found: " + tr.task_id);
    return Result::Err(ErrorCode::Conflict, "task status changed: " + tr.task_id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshots / checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::InsertComputedSnapshot(Transaction& t, uint64_t at_ms) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "INSERT INTO system_snapshots(timestamp,total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,average_context_usage)"
           " SELECT ?1, a.total, a.active, k.total, k.completed, k.failed, a.avg_usage FROM"
           " (SELECT COUNT(*) AS total,"
           "   COALESCE(SUM(CASE WHEN status IN ('idle','busy') THEN 1 ELSE 0 END),0) AS active,"
           "   COALESCE(AVG(context_usage),0.0) AS avg_usage FROM agents) a,"
           " (SELECT COUNT(*) AS total,"
           "   COALESCE(SUM(CASE WHEN status='completed' THEN 1 ELSE 0 END),0) AS completed,"
           "   COALESCE(SUM(CASE WHEN status='failed' THEN 1 ELSE 0 END),0) AS failed FROM tasks) k;");
  BindU64(st.get(), 1, at_ms);
  return Translate(tx.Handle(), sqlite3_step(st.get()));
}

Result SqliteRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "INSERT INTO system_snapshots(timestamp,total_agents,active_agents,total_tasks,completed_tasks,failed_tasks,average_context_usage,quality_score,metadata)"
           " VALUES(?,?,?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, r.timestamp_ms);
  sqlite3_bind_int64(st.get(), 2, r.total_agents);
  sqlite3_bind_int64(st.get(), 3, r.active_agents);
  sqlite3_bind_int64(st.get(), 4, r.total_tasks);
  sqlite3_bind_int64(st.get(), 5, r.completed_tasks);
  sqlite3_bind_int64(st.get(), 6, r.failed_tasks);
  BindDouble(st.get(), 7, r.average_context_usage);
  BindDouble(st.get(), 8, r.quality_score);
  BindText(st.get(), 9, r.metadata_json);

  auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
  if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return result;
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshots(Transaction& t, uint64_t since_ms, uint64_t limit) {
  auto&       tx  = TX(t);
  std::string sql = std::string("SELECT ") + kSnapshotColumns +
                    " FROM system_snapshots WHERE timestamp>=? ORDER BY timestamp DESC, id DESC LIMIT ?;";
  Stmt st(tx.DB(), sql.c_str());
  BindU64(st.get(), 1, since_ms);
  BindU64(st.get(), 2, limit);

  std::vector<model::SnapshotRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadSnapshot(st.get()));
  return out;
}

Result SqliteRepository::InsertCheckpoint(Transaction& t, model::CheckpointRecord& r) {
  auto& tx = TX(t);
  if (r.timestamp_ms == 0) r.timestamp_ms = util::NowMillis();

  Stmt st(tx.DB(), "INSERT INTO checkpoints(checkpoint_name,timestamp,data) VALUES(?,?,?);");
  BindText(st.get(), 1, r.name);
  BindU64(st.get(), 2, r.timestamp_ms);
  BindText(st.get(), 3, r.data_json);

  auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
  if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return result;
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpoints(Transaction& t, const model::CheckpointQuery& q) {
  auto& tx = TX(t);
  Stmt  st(tx.DB(),
           "SELECT id,checkpoint_name,timestamp,data FROM checkpoints"
           " WHERE (?1 IS NULL OR checkpoint_name=?1)"
           " AND (?2 IS NULL OR timestamp>=?2)"
           " AND (?3 IS NULL OR timestamp<=?3)"
           " ORDER BY timestamp DESC, id DESC LIMIT ?4;");
  if (q.name) {
    BindText(st.get(), 1, *q.name);
  } else {
    sqlite3_bind_null(st.get(), 1);
  }
  if (q.since_ms) {
    BindU64(st.get(), 2, *q.since_ms);
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  if (q.until_ms) {
    BindU64(st.get(), 3, *q.until_ms);
  } else {
    sqlite3_bind_null(st.get(), 3);
  }
  BindU64(st.get(), 4, q.limit);

  std::vector<model::CheckpointRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::CheckpointRecord r;
    r.id           = ColU64(st.get(), 0);
    r.name         = ColText(st.get(), 1);
    r.timestamp_ms = ColU64(st.get(), 2);
    r.data_json    = ColText(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

void SqliteRepository::Probe(Transaction& t) {
  Stmt st(TX(t).DB(), "SELECT 1;");
  st.Step();
}

PoolStats SqliteRepository::Stats() const {
  PoolStats stats;
  stats.size     = 1;
  stats.idle     = 1;
  stats.min_size = 1;
  stats.max_size = 1;
  return stats;
}

} // namespace hivestate::db::sqlite
