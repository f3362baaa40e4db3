#include "internal/orchestrator/hybrid_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ephemeral/keys.hpp"
#include "internal/ephemeral/memory/memory_backend.hpp"

namespace {

using hivestate::db::memory::MemoryRepository;
using hivestate::ephemeral::EphemeralStore;
using hivestate::ephemeral::memory::MemoryBackend;
using hivestate::orchestrator::HealthStatus;
using hivestate::orchestrator::HybridOrchestrator;
using hivestate::persistent::PersistentStore;
using hivestate::policy::DistributionPolicy;
using hivestate::util::ErrorCode;
using namespace hivestate::state::v1;

namespace keys = hivestate::ephemeral::keys;

struct Harness {
  std::shared_ptr<MemoryBackend>      backend;
  std::shared_ptr<EphemeralStore>     ephemeral;
  std::shared_ptr<PersistentStore>    persistent;
  std::shared_ptr<HybridOrchestrator> hybrid;

  explicit Harness(hivestate::config::CacheSettings cache = {}, bool with_ephemeral = true) {
    hivestate::config::EphemeralSettings settings;
    settings.block_timeout = std::chrono::milliseconds(0);

    persistent = std::make_shared<PersistentStore>(std::make_shared<MemoryRepository>());
    if (with_ephemeral) {
      backend   = std::make_shared<MemoryBackend>();
      ephemeral = std::make_shared<EphemeralStore>(backend, settings);
    }
    auto policy = std::make_shared<const DistributionPolicy>(settings, cache);
    hybrid      = std::make_shared<HybridOrchestrator>(persistent, ephemeral, policy, cache.hit_ratio_target);
    assert(hybrid->Initialize());
  }
};

void TestRegisterWritesThroughToCache() {
  Harness h;
  assert(h.hybrid->RegisterAgent("a1", {"python"}));

  auto cached = h.ephemeral->GetAgentState("a1");
  assert(cached.ok() && cached.value.has_value());
  assert(cached.value->status() == AGENT_STATUS_IDLE);

  AgentUpdate update;
  update.set_agent_id("a1");
  update.set_context_usage(0.4);
  assert(h.hybrid->UpdateAgentState(update));

  // The cache holds the full stored row after a partial update.
  cached = h.ephemeral->GetAgentState("a1");
  assert(cached.value->context_usage() == 0.4);
  assert(cached.value->capabilities_size() == 1);
}

void TestCacheAsideCountsHitsAndMisses() {
  Harness h;
  assert(h.persistent->RegisterAgent("a1", {}));

  auto first = h.hybrid->GetAgentState("a1");
  assert(first.ok() && first.value.has_value());
  auto second = h.hybrid->GetAgentState("a1");
  assert(second.ok() && second.value.has_value());

  auto stats = h.hybrid->GetPerformanceStats();
  assert(stats.cache_misses == 1);
  assert(stats.cache_hits == 1);
  assert(stats.hit_ratio == 0.5);
  assert(!stats.performance_ok);
  assert(stats.reads == 2);

  auto health = h.hybrid->HealthCheck();
  assert(!health.hit_ratio_ok);
  assert(health.status == HealthStatus::kDegraded);

  auto missing = h.hybrid->GetAgentState("ghost");
  assert(missing.ok() && !missing.value.has_value());
}

void TestRepeatedReadsConvergeOnTarget() {
  Harness h;
  for (int i = 0; i < 10; ++i) {
    assert(h.persistent->RegisterAgent("agent-" + std::to_string(i), {}));
  }
  for (int round = 0; round < 20; ++round) {
    for (int i = 0; i < 10; ++i) {
      assert(h.hybrid->GetAgentState("agent-" + std::to_string(i)).value.has_value());
    }
  }

  // 10 cold misses out of 200 reads.
  auto stats = h.hybrid->GetPerformanceStats();
  assert(stats.cache_misses == 10);
  assert(stats.hit_ratio >= 0.95);
  assert(stats.performance_ok);
  assert(h.hybrid->HealthCheck().status == HealthStatus::kHealthy);
}

void TestAssignAndFinishEvictStaleCopies() {
  Harness h;
  assert(h.hybrid->RegisterAgent("worker", {}));

  NewTask task;
  task.set_priority(7);
  auto id = h.hybrid->CreateTask(task);
  assert(id.ok());

  // Warm both caches.
  assert(h.hybrid->GetTask(id.value).value.has_value());
  assert(h.ephemeral->GetCachedTask(id.value).value.has_value());
  assert(h.ephemeral->GetAgentState("worker").value.has_value());

  assert(h.hybrid->AssignTask(id.value, "worker"));
  assert(!h.ephemeral->GetCachedTask(id.value).value.has_value());
  assert(!h.ephemeral->GetAgentState("worker").value.has_value());

  auto agent = h.hybrid->GetAgentState("worker");
  assert(agent.value->status() == AGENT_STATUS_BUSY);
  auto assigned = h.hybrid->GetTask(id.value);
  assert(assigned.value->status() == TASK_STATUS_ASSIGNED);

  assert(h.hybrid->FinishTask(id.value, TASK_STATUS_COMPLETED, std::nullopt));
  assert(!h.ephemeral->GetCachedTask(id.value).value.has_value());
  assert(h.hybrid->GetAgentState("worker").value->status() == AGENT_STATUS_IDLE);
  assert(h.hybrid->GetTask(id.value).value->status() == TASK_STATUS_COMPLETED);
}

void TestRemoveAndBatchEvict() {
  Harness h;
  assert(h.hybrid->RegisterAgent("a1", {}));
  assert(h.hybrid->RegisterAgent("a2", {}));

  AgentUpdate update;
  update.set_agent_id("a2");
  update.set_status(AGENT_STATUS_BUSY);
  auto batch = h.hybrid->BatchUpdateAgents({update});
  assert(batch.ok() && batch.value == 1);
  assert(!h.ephemeral->GetAgentState("a2").value.has_value());
  assert(h.hybrid->GetAgentState("a2").value->status() == AGENT_STATUS_BUSY);

  assert(h.hybrid->RemoveAgent("a1"));
  assert(!h.ephemeral->GetAgentState("a1").value.has_value());
  assert(h.hybrid->GetAgentState("a1").value->status() == AGENT_STATUS_OFFLINE);
}

void TestCacheOutageDoesNotFailWrites() {
  Harness h;
  h.backend->SetAvailable(false);

  assert(h.hybrid->RegisterAgent("a1", {}));
  auto read = h.hybrid->GetAgentState("a1");
  assert(read.ok() && read.value.has_value());

  auto health = h.hybrid->HealthCheck();
  assert(health.status == HealthStatus::kDegraded);
  assert(health.ephemeral.has_value() && !health.ephemeral->connected);

  auto queued = h.hybrid->QueueTask({});
  assert(!queued.ok() && queued.status.code == ErrorCode::Unavailable);

  h.backend->SetAvailable(true);
}

void TestDisabledAgentCachingBypassesEphemeral() {
  hivestate::config::CacheSettings cache;
  cache.cache_agent_state = false;
  Harness h(cache);

  assert(h.hybrid->RegisterAgent("a1", {}));
  assert(!h.ephemeral->GetAgentState("a1").value.has_value());
  assert(h.hybrid->GetAgentState("a1").value.has_value());

  auto stats = h.hybrid->GetPerformanceStats();
  assert(stats.cache_hits + stats.cache_misses == 0);
  assert(stats.performance_ok);
}

void TestStreamsSessionsAndMetricsPassThrough() {
  Harness h;

  google::protobuf::Struct body;
  (*body.mutable_fields())["task_id"].set_string_value("t1");
  auto queued = h.hybrid->QueueTask(body);
  assert(queued.ok());

  auto consumed = h.hybrid->ConsumeTasks(std::string(keys::kTaskProcessors), "w1");
  assert(consumed.ok() && consumed.value.size() == 1);
  assert(h.hybrid->AcknowledgeTask(std::string(keys::kTaskProcessors), consumed.value[0].message_id()));

  assert(h.hybrid->PublishEvent(body).ok());
  assert(h.hybrid->ConsumeEvents(std::string(keys::kAnalytics), "a1").value.size() == 1);

  assert(h.hybrid->CreateSession("s1", body));
  assert(h.hybrid->GetSession("s1").value.has_value());
  assert(h.hybrid->ExtendSession("s1").value);

  assert(h.hybrid->SetCoordinationState("op", body));
  assert(h.hybrid->GetCoordinationState("op").value.has_value());

  assert(h.hybrid->IncrementMetric("assigned", 2).value == 2);
  assert(h.hybrid->GetMetric("assigned").value == 2);
}

void TestWithoutEphemeralStore() {
  Harness h({}, false);

  assert(h.hybrid->RegisterAgent("a1", {}));
  assert(h.hybrid->GetAgentState("a1").value.has_value());

  auto session = h.hybrid->CreateSession("s", {});
  assert(!session && session.code == ErrorCode::Unavailable);
  assert(h.hybrid->GetMetric("x").status.code == ErrorCode::Unavailable);

  Task task;
  task.set_task_id("t");
  auto cached = h.hybrid->CacheTask(task);
  assert(!cached && cached.code == ErrorCode::Unavailable);

  auto health = h.hybrid->HealthCheck();
  assert(!health.ephemeral.has_value());
  assert(health.status == HealthStatus::kHealthy);
  assert(std::string(hivestate::orchestrator::ToString(health.status)) == "healthy");
}

void TestCheckpointsGoToPersistentStore() {
  Harness h;

  google::protobuf::Struct data;
  (*data.mutable_fields())["phase"].set_string_value("pre");
  auto id = h.hybrid->CreateCheckpoint("cp", data);
  assert(id.ok());

  auto listed = h.hybrid->GetCheckpoints(hivestate::db::model::CheckpointQuery{.name = std::string("cp")});
  assert(listed.ok() && listed.value.size() == 1);
  assert(listed.value[0].id() == id.value);

  assert(h.hybrid->CreateSystemSnapshot());
  assert(h.hybrid->GetPerformanceStats().writes == 2);
}

} // namespace

int main() {
  TestRegisterWritesThroughToCache();
  TestCacheAsideCountsHitsAndMisses();
  TestRepeatedReadsConvergeOnTarget();
  TestAssignAndFinishEvictStaleCopies();
  TestRemoveAndBatchEvict();
  TestCacheOutageDoesNotFailWrites();
  TestDisabledAgentCachingBypassesEphemeral();
  TestStreamsSessionsAndMetricsPassThrough();
  TestWithoutEphemeralStore();
  TestCheckpointsGoToPersistentStore();

  std::cout << "hivestate_unit_hybrid_orchestrator: pass\n";
  return 0;
}
