#include "internal/ephemeral/ephemeral_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/ephemeral/keys.hpp"
#include "internal/ephemeral/memory/memory_backend.hpp"
#include "internal/util/result.hpp"

namespace {

using hivestate::ephemeral::EphemeralStore;
using hivestate::ephemeral::memory::MemoryBackend;
using hivestate::util::ErrorCode;
using namespace hivestate::state::v1;
using namespace std::chrono_literals;

namespace keys = hivestate::ephemeral::keys;

struct Fixture {
  std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
  std::shared_ptr<MemoryBackend>        backend;
  std::unique_ptr<EphemeralStore>       store;

  Fixture() {
    backend = std::make_shared<MemoryBackend>([this] { return now; });

    hivestate::config::EphemeralSettings settings;
    settings.block_timeout = 0ms;
    settings.stream_maxlen = 100;
    store                  = std::make_unique<EphemeralStore>(backend, settings);
    assert(store->Initialize());
  }
};

google::protobuf::Struct Body(const std::string& key, const std::string& value) {
  google::protobuf::Struct body;
  (*body.mutable_fields())[key].set_string_value(value);
  return body;
}

void TestAgentStateCache() {
  Fixture f;

  Agent agent;
  agent.set_agent_id("a1");
  agent.set_status(AGENT_STATUS_BUSY);
  agent.set_context_usage(0.25);
  agent.add_capabilities("python");
  assert(f.store->SetAgentState(agent, 60s));

  auto hit = f.store->GetAgentState("a1");
  assert(hit.ok() && hit.value.has_value());
  assert(hit.value->status() == AGENT_STATUS_BUSY);
  assert(hit.value->capabilities_size() == 1);

  auto miss = f.store->GetAgentState("nobody");
  assert(miss.ok() && !miss.value.has_value());

  f.now += 61s;
  auto expired = f.store->GetAgentState("a1");
  assert(expired.ok() && !expired.value.has_value());

  assert(f.store->SetAgentState(agent));
  assert(f.store->DeleteAgentState("a1"));
  assert(!f.store->GetAgentState("a1").value.has_value());
}

void TestUnreadableEntryIsAMiss() {
  Fixture f;
  f.backend->SetEx(keys::AgentState("broken"), "{not json", 60s);

  auto read = f.store->GetAgentState("broken");
  assert(read.ok());
  assert(!read.value.has_value());
}

void TestTaskCacheUsesTaskTtl() {
  Fixture f;

  Task task;
  task.set_task_id("t1");
  task.set_status(TASK_STATUS_PENDING);
  task.set_priority(8);
  assert(f.store->CacheTask(task));

  f.now += f.store->Settings().task_ttl - 1s;
  assert(f.store->GetCachedTask("t1").value.has_value());

  f.now += 2s;
  assert(!f.store->GetCachedTask("t1").value.has_value());
}

void TestBatchCacheAgents() {
  Fixture f;

  std::map<std::string, Agent> agents;
  for (const char* id : {"a", "b", "c"}) {
    Agent agent;
    agent.set_agent_id(id);
    agents[id] = agent;
  }
  auto cached = f.store->BatchCacheAgents(agents);
  assert(cached.ok() && cached.value == 3);
  assert(f.store->GetAgentState("b").value.has_value());

  auto none = f.store->BatchCacheAgents({});
  assert(none.ok() && none.value == 0);
}

void TestSessionsAndCoordination() {
  Fixture f;

  assert(f.store->CreateSession("s1", Body("user", "alice"), 10s));
  auto session = f.store->GetSession("s1");
  assert(session.ok() && session.value.has_value());
  assert(session.value->fields().at("user").string_value() == "alice");

  f.now += 8s;
  auto extended = f.store->ExtendSession("s1", 10s);
  assert(extended.ok() && extended.value);

  f.now += 8s;
  assert(f.store->GetSession("s1").value.has_value());

  f.now += 3s;
  assert(!f.store->GetSession("s1").value.has_value());
  auto gone = f.store->ExtendSession("s1");
  assert(gone.ok() && !gone.value);

  assert(f.store->SetCoordinationState("op1", Body("phase", "lock"), 5s));
  assert(f.store->GetCoordinationState("op1").value.has_value());
  f.now += 6s;
  assert(!f.store->GetCoordinationState("op1").value.has_value());
}

void TestTaskQueueRoundTrip() {
  Fixture f;

  google::protobuf::Struct task = Body("task_id", "t-42");
  (*task.mutable_fields())["priority"].set_number_value(7);

  auto queued = f.store->QueueTask(task);
  assert(queued.ok() && !queued.value.empty());

  auto consumed = f.store->ConsumeTasks(std::string(keys::kTaskProcessors), "worker-1", 5);
  assert(consumed.ok());
  assert(consumed.value.size() == 1);

  const auto& message = consumed.value[0];
  assert(message.message_id() == queued.value);
  assert(message.stream() == keys::kTasksStream);
  const auto& fields = message.fields().fields();
  assert(fields.at("task_id").string_value() == "t-42");
  assert(fields.at("priority").number_value() == 7);
  assert(fields.count("queued_at") == 1);
  assert(fields.count("queue_id") == 1);

  // Delivered once per group.
  assert(f.store->ConsumeTasks(std::string(keys::kTaskProcessors), "worker-2").value.empty());
  assert(f.store->ConsumeTasks(std::string(keys::kPriorityProcessors), "worker-3").value.size() == 1);

  assert(f.store->AcknowledgeTask(std::string(keys::kTaskProcessors), message.message_id()));
  auto again = f.store->AcknowledgeTask(std::string(keys::kTaskProcessors), message.message_id());
  assert(!again && again.code == ErrorCode::NotFound);
}

void TestEventsAndUnknownGroup() {
  Fixture f;

  auto published = f.store->PublishEvent(Body("type", "agent_registered"));
  assert(published.ok());

  auto events = f.store->ConsumeEvents(std::string(keys::kMonitoring), "m1");
  assert(events.ok() && events.value.size() == 1);
  assert(events.value[0].fields().fields().count("event_id") == 1);
  assert(f.store->AcknowledgeEvent(std::string(keys::kMonitoring), events.value[0].message_id()));

  auto unknown = f.store->ConsumeEvents("nobody", "m1");
  assert(!unknown.ok());
  assert(unknown.status.code == ErrorCode::NotFound);
}

void TestMetrics() {
  Fixture f;

  assert(f.store->GetMetric("tasks_done").value == 0);
  assert(f.store->IncrementMetric("tasks_done").value == 1);
  assert(f.store->IncrementMetric("tasks_done", 5).value == 6);
  assert(f.store->GetMetric("tasks_done").value == 6);

  f.backend->SetEx(keys::Metric("bad"), "x1", 60s);
  auto bad = f.store->GetMetric("bad");
  assert(!bad.ok() && bad.status.code == ErrorCode::Corruption);
}

void TestBackendFailureIsReturned() {
  Fixture f;
  f.backend->SetAvailable(false);

  Agent agent;
  agent.set_agent_id("a");
  auto set = f.store->SetAgentState(agent);
  assert(!set && set.code == ErrorCode::Unavailable);

  auto get = f.store->GetAgentState("a");
  assert(!get.ok() && get.status.code == ErrorCode::Unavailable);

  auto health = f.store->HealthCheck();
  assert(!health.connected);
  assert(!health.error.empty());

  f.backend->SetAvailable(true);
  health = f.store->HealthCheck();
  assert(health.connected);
  assert(health.stream_lengths.count(std::string(keys::kTasksStream)) == 1);
}

} // namespace

int main() {
  TestAgentStateCache();
  TestUnreadableEntryIsAMiss();
  TestTaskCacheUsesTaskTtl();
  TestBatchCacheAgents();
  TestSessionsAndCoordination();
  TestTaskQueueRoundTrip();
  TestEventsAndUnknownGroup();
  TestMetrics();
  TestBackendFailureIsReturned();

  std::cout << "hivestate_unit_ephemeral_store: pass\n";
  return 0;
}
