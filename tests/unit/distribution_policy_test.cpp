#include "internal/policy/distribution_policy.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <set>
#include <string>

namespace {

using hivestate::policy::CacheAction;
using hivestate::policy::Consistency;
using hivestate::policy::DistributionPolicy;
using hivestate::policy::Operation;
using hivestate::policy::StoreLayer;
using hivestate::policy::Strategy;
using namespace std::chrono_literals;

void TestDefaultRoutes() {
  hivestate::config::EphemeralSettings ephemeral;
  hivestate::config::CacheSettings     cache;
  cache.agent_ttl = 120s;
  DistributionPolicy policy(ephemeral, cache);

  const auto& get_agent = policy.For(Operation::kGetAgentState);
  assert(get_agent.layer == StoreLayer::kPersistent);
  assert(get_agent.strategy == Strategy::kCacheAside);
  assert(get_agent.consistency == Consistency::kEventual);
  assert(get_agent.ttl == 120s);
  assert(get_agent.key_pattern == "agent:state:{agent_id}");

  const auto& update = policy.For(Operation::kUpdateAgentState);
  assert(update.strategy == Strategy::kWriteThrough);
  assert(update.cache_action == CacheAction::kRefresh);

  assert(policy.For(Operation::kRemoveAgent).cache_action == CacheAction::kInvalidate);
  assert(policy.For(Operation::kAssignTask).consistency == Consistency::kStrong);
  assert(policy.For(Operation::kFinishTask).cache_action == CacheAction::kInvalidate);
  assert(policy.For(Operation::kCreateCheckpoint).strategy == Strategy::kPersistentOnly);

  const auto& queue = policy.For(Operation::kQueueTask);
  assert(queue.layer == StoreLayer::kStream);
  assert(queue.key_pattern == "tasks:pending");

  const auto& session = policy.For(Operation::kSession);
  assert(session.consistency == Consistency::kSession);
  assert(session.ttl == ephemeral.session_ttl);

  assert(policy.For(Operation::kCoordination).ttl == ephemeral.coordination_ttl);
  assert(policy.For(Operation::kIncrementMetric).ttl == ephemeral.metric_ttl);
}

void TestDisabledCachingIsPersistentOnly() {
  hivestate::config::EphemeralSettings ephemeral;
  hivestate::config::CacheSettings     cache;
  cache.cache_agent_state = false;
  cache.cache_task_data   = false;
  DistributionPolicy policy(ephemeral, cache);

  for (auto op : {Operation::kRegisterAgent, Operation::kGetAgentState, Operation::kUpdateAgentState, Operation::kGetTask,
                  Operation::kCacheTask}) {
    const auto& rule = policy.For(op);
    assert(rule.strategy == Strategy::kPersistentOnly);
    assert(rule.consistency == Consistency::kStrong);
  }
  // Stale task copies are still dropped after assignment.
  assert(policy.For(Operation::kAssignTask).cache_action == CacheAction::kInvalidate);
}

void TestEveryOperationIsNamed() {
  std::set<std::string> names;
  for (std::size_t i = 0; i < static_cast<std::size_t>(Operation::kCount); ++i) {
    const char* name = DistributionPolicy::Name(static_cast<Operation>(i));
    assert(std::strcmp(name, "unknown") != 0);
    names.insert(name);
  }
  assert(names.size() == static_cast<std::size_t>(Operation::kCount));

  assert(std::string(hivestate::policy::ToString(StoreLayer::kStream)) == "stream");
  assert(std::string(hivestate::policy::ToString(Strategy::kCacheAside)) == "cache_aside");
  assert(std::string(hivestate::policy::ToString(Consistency::kStrong)) == "strong");
}

} // namespace

int main() {
  TestDefaultRoutes();
  TestDisabledCachingIsPersistentOnly();
  TestEveryOperationIsNamed();

  std::cout << "hivestate_unit_distribution_policy: pass\n";
  return 0;
}
