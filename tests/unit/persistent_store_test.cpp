#include "internal/persistent/persistent_store.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using hivestate::db::Repository;
using hivestate::db::Transaction;
using hivestate::db::memory::MemoryRepository;
using hivestate::persistent::PersistentStore;
using hivestate::util::ErrorCode;
using hivestate::util::StoreError;
using namespace hivestate::state::v1;
namespace model = hivestate::db::model;

/*
  Forwards to a MemoryRepository but fails the first `failures` commits
  with SerializationFailure, as a contended database would. SetDown(true)
  makes every Begin fail like a lost server. FailPatchAt(n) makes the
  n-th PatchAgent from then on throw, as a connection dropped mid
  transaction would.
*/
class FlakyCommitRepository final : public Repository {
 public:
  explicit FlakyCommitRepository(int failures) : failures_(failures) {}

  std::unique_ptr<Transaction> Begin() override {
    if (down_) {
      throw StoreError(ErrorCode::Unavailable, "injected outage");
    }
    return std::make_unique<Tx>(inner_.Begin(), &failures_, &commits_);
  }

  hivestate::db::Result UpsertAgent(Transaction& t, const model::AgentRecord& r) override {
    return inner_.UpsertAgent(In(t), r);
  }
  std::optional<model::AgentRecord> GetAgent(Transaction& t, const std::string& id) override {
    return inner_.GetAgent(In(t), id);
  }
  hivestate::db::Result PatchAgent(Transaction& t, const model::AgentPatch& p) override {
    if (patch_failure_at_.fetch_sub(1) == 1) {
      throw StoreError(ErrorCode::Unavailable, "injected failure mid batch");
    }
    return inner_.PatchAgent(In(t), p);
  }
  std::vector<model::AgentRecord> ListActiveAgents(Transaction& t, uint64_t since_ms) override {
    return inner_.ListActiveAgents(In(t), since_ms);
  }
  uint64_t CountAgents(Transaction& t, const std::string& prefix) override {
    return inner_.CountAgents(In(t), prefix);
  }
  hivestate::db::Result ReleaseAgentTask(Transaction& t, const std::string& a, const std::string& task, uint64_t at) override {
    return inner_.ReleaseAgentTask(In(t), a, task, at);
  }
  hivestate::db::Result InsertTask(Transaction& t, model::TaskRecord& r) override {
    return inner_.InsertTask(In(t), r);
  }
  std::optional<model::TaskRecord> GetTask(Transaction& t, const std::string& id) override {
    return inner_.GetTask(In(t), id);
  }
  std::vector<model::TaskRecord> ListPendingTasks(Transaction& t, uint64_t limit) override {
    return inner_.ListPendingTasks(In(t), limit);
  }
  hivestate::db::Result AssignTask(Transaction& t, const std::string& task, const std::string& a, uint64_t at) override {
    return inner_.AssignTask(In(t), task, a, at);
  }
  hivestate::db::Result TransitionTask(Transaction& t, const model::TaskTransition& tr) override {
    return inner_.TransitionTask(In(t), tr);
  }
  hivestate::db::Result InsertComputedSnapshot(Transaction& t, uint64_t at) override {
    return inner_.InsertComputedSnapshot(In(t), at);
  }
  hivestate::db::Result InsertSnapshot(Transaction& t, model::SnapshotRecord& r) override {
    return inner_.InsertSnapshot(In(t), r);
  }
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction& t, uint64_t since, uint64_t limit) override {
    return inner_.ListSnapshots(In(t), since, limit);
  }
  hivestate::db::Result InsertCheckpoint(Transaction& t, model::CheckpointRecord& r) override {
    return inner_.InsertCheckpoint(In(t), r);
  }
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction& t, const model::CheckpointQuery& q) override {
    return inner_.ListCheckpoints(In(t), q);
  }
  void Probe(Transaction& t) override {
    inner_.Probe(In(t));
  }
  hivestate::db::PoolStats Stats() const override {
    return inner_.Stats();
  }

  int Commits() const {
    return commits_.load();
  }

  void SetDown(bool down) {
    down_ = down;
  }

  void FailPatchAt(int n) {
    patch_failure_at_ = n;
  }

 private:
  class Tx final : public Transaction {
   public:
    Tx(std::unique_ptr<Transaction> inner, std::atomic<int>* failures, std::atomic<int>* commits)
        : inner_(std::move(inner)), failures_(failures), commits_(commits) {}

    void Commit() override {
      if (failures_->fetch_sub(1) > 0) {
        throw StoreError(ErrorCode::SerializationFailure, "injected serialization failure");
      }
      inner_->Commit();
      ++*commits_;
    }
    void Rollback() override {
      inner_->Rollback();
    }
    bool IsCommitted() const override {
      return inner_->IsCommitted();
    }

    std::unique_ptr<Transaction> inner_;
    std::atomic<int>*            failures_;
    std::atomic<int>*            commits_;
  };

  static Transaction& In(Transaction& t) {
    return *static_cast<Tx&>(t).inner_;
  }

  MemoryRepository inner_;
  std::atomic<int> failures_;
  std::atomic<int> commits_{0};
  std::atomic<bool> down_{false};
  std::atomic<int>  patch_failure_at_{0};
};

PersistentStore MakeStore() {
  return PersistentStore(std::make_shared<MemoryRepository>());
}

AgentUpdate Update(const std::string& agent_id) {
  AgentUpdate update;
  update.set_agent_id(agent_id);
  return update;
}

void TestAgentRegistrationAndUpdates() {
  auto store = MakeStore();

  assert(store.RegisterAgent("a1", {"python", "sql"}));
  auto agent = store.GetAgentState("a1");
  assert(agent.ok() && agent.value.has_value());
  assert(agent.value->status() == AGENT_STATUS_IDLE);
  assert(agent.value->capabilities_size() == 2);
  assert(agent.value->last_activity().seconds() > 0);

  auto update = Update("a1");
  update.set_status(AGENT_STATUS_BUSY);
  update.set_context_usage(0.75);
  (*update.mutable_performance_metrics()->mutable_values())["latency_ms"] = 12.5;
  assert(store.UpdateAgentState(update));

  // Re-registering keeps status and usage.
  assert(store.RegisterAgent("a1", {"python"}));
  agent = store.GetAgentState("a1");
  assert(agent.value->status() == AGENT_STATUS_BUSY);
  assert(agent.value->context_usage() == 0.75);
  assert(agent.value->capabilities_size() == 1);
  assert(agent.value->performance_metrics().at("latency_ms") == 12.5);

  assert(!store.GetAgentState("missing").value.has_value());

  auto unknown = store.UpdateAgentState(Update("missing"));
  assert(!unknown && unknown.code == ErrorCode::NotFound);

  auto bad_usage = Update("a1");
  bad_usage.set_context_usage(1.5);
  auto r = store.UpdateAgentState(bad_usage);
  assert(!r && r.code == ErrorCode::InvalidArgument);

  auto empty_id = store.RegisterAgent("", {});
  assert(!empty_id && empty_id.code == ErrorCode::InvalidArgument);
}

void TestRemoveAndActiveAgents() {
  auto store = MakeStore();
  assert(store.RegisterAgent("a1", {}));
  assert(store.RegisterAgent("a2", {}));
  assert(store.RemoveAgent("a2"));

  auto removed = store.GetAgentState("a2");
  assert(removed.value.has_value());
  assert(removed.value->status() == AGENT_STATUS_OFFLINE);

  auto active = store.GetActiveAgents();
  assert(active.ok());
  assert(active.value.size() == 1);
  assert(active.value[0].agent_id() == "a1");

  auto missing = store.RemoveAgent("nobody");
  assert(!missing && missing.code == ErrorCode::NotFound);
}

void TestBatchUpdateSkipsUnknownAgents() {
  auto store = MakeStore();
  assert(store.RegisterAgent("a1", {}));
  assert(store.RegisterAgent("a2", {}));

  std::vector<AgentUpdate> updates = {Update("a1"), Update("a2"), Update("ghost")};
  for (auto& update : updates) update.set_context_usage(0.5);

  auto batch = store.BatchUpdateAgents(updates);
  assert(batch.ok() && batch.value == 2);
  assert(store.GetAgentState("a2").value->context_usage() == 0.5);

  // Invalid rows are rejected before anything is written.
  updates[0].set_context_usage(0.9);
  updates[1].set_context_usage(-1);
  auto invalid = store.BatchUpdateAgents(updates);
  assert(!invalid.ok() && invalid.status.code == ErrorCode::InvalidArgument);
  assert(store.GetAgentState("a1").value->context_usage() == 0.5);
}

void TestBatchUpdateRollsBackOnMidBatchFailure() {
  auto            repo = std::make_shared<FlakyCommitRepository>(0);
  PersistentStore store(repo);
  for (const char* id : {"a1", "a2", "a3"}) {
    assert(store.RegisterAgent(id, {}));
  }

  std::vector<AgentUpdate> updates = {Update("a1"), Update("a2"), Update("a3")};
  for (auto& update : updates) update.set_context_usage(0.7);

  const int commits = repo->Commits();
  repo->FailPatchAt(3);
  auto batch = store.BatchUpdateAgents(updates);
  assert(!batch.ok() && batch.status.code == ErrorCode::Unavailable);
  assert(repo->Commits() == commits);

  // The first two patches went through the transaction and were discarded.
  for (const char* id : {"a1", "a2", "a3"}) {
    assert(store.GetAgentState(id).value->context_usage() == 0.0);
  }

  auto retry = store.BatchUpdateAgents(updates);
  assert(retry.ok() && retry.value == 3);
  assert(store.GetAgentState("a1").value->context_usage() == 0.7);
}

void TestTaskLifecycle() {
  auto store = MakeStore();
  assert(store.RegisterAgent("worker", {}));

  NewTask low;
  low.set_priority(1);
  NewTask high;
  high.set_priority(9);
  (*high.mutable_metadata()->mutable_fields())["kind"].set_string_value("build");

  auto low_id  = store.CreateTask(low);
  auto high_id = store.CreateTask(high);
  assert(low_id.ok() && high_id.ok());

  NewTask defaulted;
  auto    defaulted_id = store.CreateTask(defaulted);
  assert(store.GetTask(defaulted_id.value).value->priority() == 5);

  NewTask not_pending;
  not_pending.set_status(TASK_STATUS_COMPLETED);
  assert(!store.CreateTask(not_pending).ok());

  auto pending = store.GetPendingTasks(10);
  assert(pending.ok() && pending.value.size() == 3);
  assert(pending.value[0].task_id() == high_id.value);
  assert(pending.value[2].task_id() == low_id.value);
  assert(pending.value[0].metadata().fields().at("kind").string_value() == "build");

  auto no_agent = store.AssignTask(high_id.value, "ghost");
  assert(!no_agent && no_agent.code == ErrorCode::NotFound);

  assert(store.AssignTask(high_id.value, "worker"));
  auto again = store.AssignTask(high_id.value, "worker");
  assert(!again && again.code == ErrorCode::Conflict);

  auto worker = store.GetAgentState("worker").value;
  assert(worker->status() == AGENT_STATUS_BUSY);
  assert(worker->current_task_id() == high_id.value);

  assert(store.StartTask(high_id.value));
  auto restart = store.StartTask(high_id.value);
  assert(!restart && restart.code == ErrorCode::Conflict);

  auto not_final = store.FinishTask(high_id.value, TASK_STATUS_IN_PROGRESS, std::nullopt);
  assert(!not_final && not_final.code == ErrorCode::InvalidArgument);

  google::protobuf::Value result;
  result.set_string_value("artifact.tar");
  assert(store.FinishTask(high_id.value, TASK_STATUS_COMPLETED, result));

  auto done = store.GetTask(high_id.value).value;
  assert(done->status() == TASK_STATUS_COMPLETED);
  assert(done->result().string_value() == "artifact.tar");
  assert(done->completed_at().seconds() > 0);

  worker = store.GetAgentState("worker").value;
  assert(worker->status() == AGENT_STATUS_IDLE);
  assert(worker->current_task_id().empty());

  auto twice = store.FinishTask(high_id.value, TASK_STATUS_FAILED, std::nullopt);
  assert(!twice && twice.code == ErrorCode::Conflict);

  auto ghost = store.FinishTask("ghost", TASK_STATUS_FAILED, std::nullopt);
  assert(!ghost && ghost.code == ErrorCode::NotFound);

  // Pending tasks cannot be finished directly.
  auto skipped = store.FinishTask(low_id.value, TASK_STATUS_COMPLETED, std::nullopt);
  assert(!skipped && skipped.code == ErrorCode::Conflict);
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

// Equal priorities come back in creation order, even inside one millisecond.
void VerifyPendingOrder(PersistentStore& store) {
  std::vector<std::string> ids;
  for (int priority : {3, 7, 7, 1}) {
    NewTask task;
    task.set_priority(priority);
    auto id = store.CreateTask(task);
    assert(id.ok());
    ids.push_back(id.value);
  }

  auto pending = store.GetPendingTasks(10);
  assert(pending.ok() && pending.value.size() == 4);
  const std::vector<std::string> expected = {ids[1], ids[2], ids[0], ids[3]};
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(pending.value[i].task_id() == expected[i]);
  }

  auto top = store.GetPendingTasks(2);
  assert(top.ok() && top.value.size() == 2);
  assert(top.value[0].task_id() == ids[1] && top.value[1].task_id() == ids[2]);
}

void TestPendingOrderBreaksPriorityTies() {
  auto memory = MakeStore();
  VerifyPendingOrder(memory);

  const auto path = std::filesystem::temp_directory_path() / ("hivestate_pending_order_" + hivestate::util::NewId() + ".db");
  {
    auto           db = std::make_shared<hivestate::db::sqlite::SqliteDB>(path.string());
    SqliteExecutor executor(*db);
    hivestate::db::sql::ApplySchema(executor, hivestate::db::sql::SqliteSchema());
    PersistentStore sqlite(std::make_shared<hivestate::db::sqlite::SqliteRepository>(std::move(db)));
    VerifyPendingOrder(sqlite);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}

void TestExclusiveAssignmentUnderContention() {
  PersistentStore store(std::make_shared<MemoryRepository>(), 5);
  constexpr int   kWorkers = 8;
  for (int i = 0; i < kWorkers; ++i) {
    assert(store.RegisterAgent("w" + std::to_string(i), {}));
  }
  auto task = store.CreateTask(NewTask());
  assert(task.ok());

  std::atomic<int>         winners{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i] {
      auto r = store.AssignTask(task.value, "w" + std::to_string(i));
      if (r) {
        ++winners;
      } else if (r.code == ErrorCode::Conflict) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
  assert(conflicts.load() == kWorkers - 1);

  auto active = store.GetActiveAgents().value;
  int  busy   = 0;
  for (const auto& agent : active) {
    if (agent.status() == AGENT_STATUS_BUSY) ++busy;
  }
  assert(busy == 1);
}

void TestSerializationFailuresAreRetried() {
  auto flaky = std::make_shared<FlakyCommitRepository>(2);
  PersistentStore store(flaky, 3);
  assert(store.RegisterAgent("a1", {}));
  assert(flaky->Commits() == 1);

  auto exhausted = std::make_shared<FlakyCommitRepository>(5);
  PersistentStore impatient(exhausted, 1);
  auto r = impatient.RegisterAgent("a1", {});
  assert(!r && r.code == ErrorCode::SerializationFailure);
  assert(exhausted->Commits() == 0);
}

void TestCheckpointsSnapshotsAndImports() {
  auto store = MakeStore();
  assert(store.RegisterAgent("a1", {}));
  assert(store.RegisterAgent("test_migration_probe", {}));

  google::protobuf::Struct data;
  (*data.mutable_fields())["step"].set_number_value(3);
  auto named = store.CreateCheckpoint("nightly", data);
  auto auto_named = store.CreateCheckpoint("", data);
  assert(named.ok() && auto_named.ok());
  assert(named.value != auto_named.value);

  auto nightly = store.GetCheckpoints(hivestate::db::model::CheckpointQuery{.name = std::string("nightly")});
  assert(nightly.ok() && nightly.value.size() == 1);
  assert(nightly.value[0].data().fields().at("step").number_value() == 3);

  auto all = store.GetCheckpoints({});
  assert(all.value.size() == 2);
  bool generated = false;
  for (const auto& cp : all.value) {
    if (cp.name().rfind("checkpoint_", 0) == 0) generated = true;
  }
  assert(generated);

  assert(store.CreateSystemSnapshot());
  auto snapshots = store.GetRecentSnapshots(hivestate::util::Now() - std::chrono::minutes(1), 10);
  assert(snapshots.ok() && snapshots.value.size() == 1);
  assert(snapshots.value[0].total_agents() == 2);

  NewTask imported;
  imported.set_task_id("legacy-1");
  imported.set_status(TASK_STATUS_COMPLETED);
  imported.set_agent_id("a1");
  auto first  = store.ImportTask(imported);
  auto second = store.ImportTask(imported);
  assert(first.ok() && second.ok());
  assert(store.GetTask("legacy-1").value->status() == TASK_STATUS_COMPLETED);

  assert(store.CountAgents().value == 2);
  assert(store.CountAgents("test_migration_").value == 1);

  auto health = store.HealthCheck();
  assert(health.connected);
  assert(health.error.empty());
}

void TestOutageIsReported() {
  auto repo = std::make_shared<FlakyCommitRepository>(0);
  PersistentStore store(repo);
  assert(store.RegisterAgent("a1", {}));

  repo->SetDown(true);
  auto read = store.GetAgentState("a1");
  assert(!read.ok() && read.status.code == ErrorCode::Unavailable);
  auto write = store.RegisterAgent("a2", {});
  assert(!write && write.code == ErrorCode::Unavailable);

  auto health = store.HealthCheck();
  assert(!health.connected);
  assert(!health.error.empty());

  repo->SetDown(false);
  assert(store.GetAgentState("a1").value.has_value());
}

} // namespace

int main() {
  TestAgentRegistrationAndUpdates();
  TestRemoveAndActiveAgents();
  TestBatchUpdateSkipsUnknownAgents();
  TestBatchUpdateRollsBackOnMidBatchFailure();
  TestTaskLifecycle();
  TestPendingOrderBreaksPriorityTies();
  TestExclusiveAssignmentUnderContention();
  TestSerializationFailuresAreRetried();
  TestCheckpointsSnapshotsAndImports();
  TestOutageIsReported();

  std::cout << "hivestate_unit_persistent_store: pass\n";
  return 0;
}
