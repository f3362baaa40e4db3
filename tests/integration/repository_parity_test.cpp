#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

#if HIVESTATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using hivestate::db::Repository;
using hivestate::db::memory::MemoryRepository;
using hivestate::db::model::AgentPatch;
using hivestate::db::model::AgentRecord;
using hivestate::db::model::CheckpointQuery;
using hivestate::db::model::CheckpointRecord;
using hivestate::db::model::SnapshotRecord;
using hivestate::db::model::TaskRecord;
using hivestate::db::model::TaskTransition;
using hivestate::util::ErrorCode;
using hivestate::util::StoreError;
using namespace hivestate::state::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

AgentRecord MakeAgent(const std::string& id, uint64_t at_ms) {
  AgentRecord agent;
  agent.agent_id          = id;
  agent.capabilities_json = R"(["python"])";
  agent.last_activity_ms  = at_ms;
  return agent;
}

void VerifyAgentUpsertAndPatch(Repository& repo, const std::string& id) {
  const uint64_t now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.UpsertAgent(*tx, MakeAgent(id, now)));

    AgentPatch patch;
    patch.agent_id                 = id;
    patch.status                   = AGENT_STATUS_BUSY;
    patch.context_usage            = 0.5;
    patch.performance_metrics_json = R"({"tasks_completed":3})";
    patch.at_ms                    = now + 10;
    assert(repo.PatchAgent(*tx, patch));
    tx->Commit();
  }

  {
    // Re-registration keeps status and usage, only capabilities move.
    auto tx                 = repo.Begin();
    auto again              = MakeAgent(id, now + 20);
    again.capabilities_json = R"(["python","sql"])";
    assert(repo.UpsertAgent(*tx, again));

    auto read = repo.GetAgent(*tx, id);
    assert(read.has_value());
    assert(read->status == AGENT_STATUS_BUSY);
    assert(read->context_usage == 0.5);
    assert(read->capabilities_json.find("sql") != std::string::npos);
    assert(read->performance_metrics_json.find("tasks_completed") != std::string::npos);
    tx->Commit();
  }

  {
    auto       tx = repo.Begin();
    AgentPatch missing;
    missing.agent_id = id + "-missing";
    missing.status   = AGENT_STATUS_IDLE;
    missing.at_ms    = now;
    auto r           = repo.PatchAgent(*tx, missing);
    assert(!r && r.code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyActiveAgentsAndCount(Repository& repo, const std::string& prefix) {
  const uint64_t now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.UpsertAgent(*tx, MakeAgent(prefix + "a", now)));
    assert(repo.UpsertAgent(*tx, MakeAgent(prefix + "b", now + 5)));
    assert(repo.UpsertAgent(*tx, MakeAgent(prefix + "stale", now - 3 * 3600 * 1000)));
    assert(repo.UpsertAgent(*tx, MakeAgent(prefix + "offline", now)));

    AgentPatch offline;
    offline.agent_id = prefix + "offline";
    offline.status   = AGENT_STATUS_OFFLINE;
    offline.at_ms    = now;
    assert(repo.PatchAgent(*tx, offline));
    tx->Commit();
  }

  auto tx = repo.Begin();

  std::vector<std::string> ours;
  for (const auto& agent : repo.ListActiveAgents(*tx, now - 3600 * 1000)) {
    if (agent.agent_id.rfind(prefix, 0) == 0) ours.push_back(agent.agent_id);
  }
  assert(ours.size() == 2);
  assert(ours[0] == prefix + "b");
  assert(ours[1] == prefix + "a");

  const uint64_t all      = repo.CountAgents(*tx, "");
  const uint64_t excluded = repo.CountAgents(*tx, prefix);
  assert(all - excluded == 4);
  tx->Commit();
}

void VerifyTaskLifecycle(Repository& repo, const std::string& prefix) {
  const uint64_t now      = NowMs();
  const auto     agent_id = prefix + "worker";

  TaskRecord low{.task_id = prefix + "low", .priority = 1, .created_at_ms = now};
  TaskRecord high_old{.task_id = prefix + "high-old", .priority = 9, .created_at_ms = now - 1000};
  TaskRecord high_new{.task_id = prefix + "high-new", .priority = 9, .created_at_ms = now};
  TaskRecord generated;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertAgent(*tx, MakeAgent(agent_id, now)));
    assert(repo.InsertTask(*tx, low));
    assert(repo.InsertTask(*tx, high_new));
    assert(repo.InsertTask(*tx, high_old));
    assert(repo.InsertTask(*tx, generated));
    assert(!generated.task_id.empty());
    assert(generated.created_at_ms != 0);

    TaskRecord duplicate{.task_id = prefix + "low"};
    auto       dup = repo.InsertTask(*tx, duplicate);
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto       tx = repo.Begin();
    TaskRecord orphan{.task_id = prefix + "orphan", .agent_id = prefix + "nobody"};
    auto       r = repo.InsertTask(*tx, orphan);
    assert(!r && r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto                     tx = repo.Begin();
    std::vector<std::string> order;
    for (const auto& task : repo.ListPendingTasks(*tx, 100000)) {
      if (task.task_id.rfind(prefix, 0) == 0) order.push_back(task.task_id);
    }
    assert(order.size() == 3);
    assert(order[0] == prefix + "high-old");
    assert(order[1] == prefix + "high-new");
    assert(order[2] == prefix + "low");
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.AssignTask(*tx, high_old.task_id, agent_id, now + 1));

    auto twice = repo.AssignTask(*tx, high_old.task_id, agent_id, now + 2);
    assert(!twice && twice.code == ErrorCode::Conflict);

    AgentPatch busy;
    busy.agent_id        = agent_id;
    busy.status          = AGENT_STATUS_BUSY;
    busy.current_task_id = high_old.task_id;
    busy.at_ms           = now + 1;
    assert(repo.PatchAgent(*tx, busy));

    TaskTransition start{.task_id = high_old.task_id, .from_a = TASK_STATUS_ASSIGNED, .to = TASK_STATUS_IN_PROGRESS, .at_ms = now + 3};
    assert(repo.TransitionTask(*tx, start));

    TaskTransition finish{.task_id          = high_old.task_id,
                          .from_a           = TASK_STATUS_ASSIGNED,
                          .from_b           = TASK_STATUS_IN_PROGRESS,
                          .to               = TASK_STATUS_COMPLETED,
                          .result_json      = R"({"ok":true})",
                          .set_completed_at = true,
                          .at_ms            = now + 4};
    assert(repo.TransitionTask(*tx, finish));

    auto refinish = repo.TransitionTask(*tx, finish);
    assert(!refinish && refinish.code == ErrorCode::Conflict);

    assert(repo.ReleaseAgentTask(*tx, agent_id, high_old.task_id, now + 4));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto task = repo.GetTask(*tx, high_old.task_id);
  assert(task.has_value());
  assert(task->status == TASK_STATUS_COMPLETED);
  assert(task->agent_id == agent_id);
  assert(task->completed_at_ms != 0);
  assert(task->result_json.find("ok") != std::string::npos);

  auto agent = repo.GetAgent(*tx, agent_id);
  assert(agent.has_value());
  assert(agent->status == AGENT_STATUS_IDLE);
  assert(agent->current_task_id.empty());

  // Releasing a task the agent no longer holds is a no-op.
  assert(repo.ReleaseAgentTask(*tx, agent_id, low.task_id, now + 5));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertAgent(*tx, MakeAgent(id, NowMs())));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetAgent(*check_tx, id).has_value());
  check_tx->Commit();
}

// Several writers race for one pending task; exactly one may win.
void VerifyExclusiveAssignment(Repository& repo, const std::string& prefix) {
  constexpr int  kWorkers = 8;
  const uint64_t now      = NowMs();
  const auto     task_id  = prefix + "contended";

  {
    auto tx = repo.Begin();
    for (int i = 0; i < kWorkers; ++i) {
      assert(repo.UpsertAgent(*tx, MakeAgent(prefix + std::to_string(i), now)));
    }
    TaskRecord task{.task_id = task_id, .created_at_ms = now};
    assert(repo.InsertTask(*tx, task));
    tx->Commit();
  }

  std::atomic<int>         winners{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kWorkers; ++i) {
    workers.emplace_back([&, i] {
      for (int attempt = 0; attempt < 50; ++attempt) {
        try {
          auto tx = repo.Begin();
          auto r  = repo.AssignTask(*tx, task_id, prefix + std::to_string(i), now);
          if (!r) {
            assert(r.code == ErrorCode::Conflict);
            ++conflicts;
            return;
          }
          tx->Commit();
          ++winners;
          return;
        } catch (const StoreError& e) {
          assert(e.Code() == ErrorCode::SerializationFailure || e.Code() == ErrorCode::Busy);
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(winners.load() == 1);
  assert(conflicts.load() == kWorkers - 1);

  auto tx   = repo.Begin();
  auto task = repo.GetTask(*tx, task_id);
  assert(task.has_value());
  assert(task->status == TASK_STATUS_ASSIGNED);
  assert(task->agent_id.rfind(prefix, 0) == 0);
  tx->Commit();
}

void VerifySnapshotsAndCheckpoints(Repository& repo, const std::string& prefix) {
  const uint64_t now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertComputedSnapshot(*tx, now));

    SnapshotRecord imported{.timestamp_ms = now - 1000, .total_agents = 7, .quality_score = 0.9, .metadata_json = R"({"imported":true})"};
    assert(repo.InsertSnapshot(*tx, imported));
    assert(imported.id != 0);

    CheckpointRecord older{.name = prefix + "cp", .timestamp_ms = now - 500, .data_json = R"({"n":1})"};
    CheckpointRecord newer{.name = prefix + "cp", .timestamp_ms = now, .data_json = R"({"n":2})"};
    CheckpointRecord other{.name = prefix + "other", .timestamp_ms = now, .data_json = "{}"};
    assert(repo.InsertCheckpoint(*tx, older));
    assert(repo.InsertCheckpoint(*tx, newer));
    assert(repo.InsertCheckpoint(*tx, other));
    assert(older.id != 0 && newer.id != older.id);
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto snapshots = repo.ListSnapshots(*tx, now - 2000, 100);
  assert(snapshots.size() >= 2);
  assert(snapshots.front().timestamp_ms >= snapshots.back().timestamp_ms);
  bool found_import = false;
  for (const auto& s : snapshots) {
    if (s.total_agents == 7 && s.metadata_json.find("imported") != std::string::npos) found_import = true;
  }
  assert(found_import);

  auto named = repo.ListCheckpoints(*tx, CheckpointQuery{.name = prefix + "cp"});
  assert(named.size() == 2);
  assert(named[0].data_json.find('2') != std::string::npos);
  assert(named[1].data_json.find('1') != std::string::npos);

  auto bounded = repo.ListCheckpoints(*tx, CheckpointQuery{.name = prefix + "cp", .until_ms = now - 100});
  assert(bounded.size() == 1);

  auto limited = repo.ListCheckpoints(*tx, CheckpointQuery{.name = prefix + "cp", .limit = 1});
  assert(limited.size() == 1);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertAgent(*tx, MakeAgent(prefix + "agent", NowMs())));
    TaskRecord task{.task_id = prefix + "task", .agent_id = prefix + "agent", .priority = 7, .metadata_json = R"({"k":"v"})"};
    assert(repo->InsertTask(*tx, task));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto a  = repo->GetAgent(*tx, prefix + "agent");
  assert(a.has_value());

  auto t = repo->GetTask(*tx, prefix + "task");
  assert(t.has_value());
  assert(t->priority == 7);
  assert(t->metadata_json.find("\"k\"") != std::string::npos);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

class SqliteExecutor final : public hivestate::db::sql::SchemaExecutor {
 public:
  explicit SqliteExecutor(hivestate::db::sqlite::SqliteDB& db) : db_(db) {}
  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  hivestate::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("hivestate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto           db = std::make_shared<hivestate::db::sqlite::SqliteDB>(db_path);
    SqliteExecutor executor(*db);
    hivestate::db::sql::ApplySchema(executor, hivestate::db::sql::SqliteSchema());
    return std::make_shared<hivestate::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

#if HIVESTATE_DB_POSTGRES
class PgExecutor final : public hivestate::db::sql::SchemaExecutor {
 public:
  explicit PgExecutor(pqxx::work& tx) : tx_(tx) {}
  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("HIVESTATE_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("HIVESTATE_TEST_PG_URI is not set");
  }

  hivestate::config::PostgresSettings settings;
  settings.conninfo        = uri;
  settings.min_connections = 1;
  settings.max_connections = 10;

  auto make_repo = [settings]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<hivestate::db::postgres::PgPool>(settings);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      PgExecutor executor(tx);
      hivestate::db::sql::ApplySchema(executor, hivestate::db::sql::PostgresSchema());
      tx.commit();
    }
    return std::make_shared<hivestate::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Postgres keeps rows between runs; every id carries a run tag.
  const auto tag = backend.name + "-" + std::to_string(NowMs()) + "-";

  VerifyAgentUpsertAndPatch(*repo, tag + "agent");
  VerifyActiveAgentsAndCount(*repo, tag + "active-");
  VerifyTaskLifecycle(*repo, tag + "life-");
  VerifyRollbackBehavior(*repo, tag + "rollback");
  VerifyExclusiveAssignment(*repo, tag + "race-");
  VerifySnapshotsAndCheckpoints(*repo, tag + "snap-");

  repo.reset();
  VerifyRestartDurability(backend, tag + "durable-");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if HIVESTATE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "hivestate_integration_repository_parity: pass\n";
  return 0;
}
