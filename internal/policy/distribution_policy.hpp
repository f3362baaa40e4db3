#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string>

#include "internal/config/settings.hpp"

namespace hivestate::policy {

enum class StoreLayer {
  kPersistent,
  kEphemeral,
  kStream,
};

enum class Consistency {
  kStrong,   // authoritative transactional write
  kEventual, // cache may lag until refreshed or expired
  kSession,
};

enum class Strategy {
  kPersistentOnly,
  kEphemeralOnly,
  kWriteThrough,
  kCacheAside,
};

// What happens to the cached copy after the authoritative step succeeded.
enum class CacheAction {
  kNone,
  kRefresh,
  kInvalidate,
};

enum class Operation : std::size_t {
  kRegisterAgent,
  kGetAgentState,
  kUpdateAgentState,
  kRemoveAgent,
  kBatchUpdateAgents,
  kGetActiveAgents,

  kCreateTask,
  kGetTask,
  kGetPendingTasks,
  kAssignTask,
  kStartTask,
  kFinishTask,
  kCacheTask,

  kCreateCheckpoint,
  kGetCheckpoints,
  kCreateSystemSnapshot,

  kQueueTask,
  kConsumeTasks,
  kPublishEvent,
  kConsumeEvents,
  kIncrementMetric,
  kSession,
  kCoordination,

  kCount
};

struct Rule {
  StoreLayer           layer        = StoreLayer::kPersistent;
  Consistency          consistency  = Consistency::kStrong;
  Strategy             strategy     = Strategy::kPersistentOnly;
  CacheAction          cache_action = CacheAction::kNone;
  std::string          key_pattern;
  std::chrono::seconds ttl{0};
};

/*
  DistributionPolicy

  Immutable table deciding, per operation, which layer is authoritative,
  the consistency it promises and how the cache copy is maintained. TTLs
  are taken from settings. Disabling agent or task caching in CacheSettings
  turns the matching rules into persistent-only ones.
*/
class DistributionPolicy {
 public:
  DistributionPolicy(const config::EphemeralSettings& ephemeral, const config::CacheSettings& cache);

  const Rule& For(Operation op) const {
    return rules_[static_cast<std::size_t>(op)];
  }

  static const char* Name(Operation op);

 private:
  std::array<Rule, static_cast<std::size_t>(Operation::kCount)> rules_;
};

const char* ToString(StoreLayer layer);
const char* ToString(Consistency consistency);
const char* ToString(Strategy strategy);

} // namespace hivestate::policy
