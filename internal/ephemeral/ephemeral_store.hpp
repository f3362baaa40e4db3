#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hivestate/state/v1.hpp"
#include "internal/config/settings.hpp"
#include "internal/ephemeral/api/backend.hpp"
#include "internal/util/result.hpp"

namespace hivestate::ephemeral {

namespace v1 = hivestate::state::v1;

struct EphemeralHealth {
  bool                            connected = false;
  double                          ping_ms   = 0.0;
  uint64_t                        used_memory_bytes = 0;
  std::map<std::string, uint64_t> stream_lengths;
  std::string                     error;
};

/*
  EphemeralStore

  TTL-bounded cache entries, sessions, coordination blobs, counters and the
  two work streams (tasks:pending, events:system).

  A cache miss is an ok result with no value. Backend failures are logged
  and returned; nothing here is fatal to callers, who treat this layer as
  optional.
*/
class EphemeralStore {
 public:
  using Ttl = std::optional<std::chrono::seconds>;

  EphemeralStore(std::shared_ptr<Backend> backend, config::EphemeralSettings settings);

  // Creates streams and consumer groups. Safe to call repeatedly.
  util::Result Initialize();

  const config::EphemeralSettings& Settings() const {
    return settings_;
  }

  // -------------------------------------------------------------------
  // Cache
  // -------------------------------------------------------------------

  util::Result                              SetAgentState(const v1::Agent& agent, Ttl ttl = std::nullopt);
  util::ValueResult<std::optional<v1::Agent>> GetAgentState(const std::string& agent_id);
  util::Result                              DeleteAgentState(const std::string& agent_id);

  util::Result                               CacheTask(const v1::Task& task, Ttl ttl = std::nullopt);
  util::ValueResult<std::optional<v1::Task>> GetCachedTask(const std::string& task_id);
  util::Result                               DeleteCachedTask(const std::string& task_id);

  util::ValueResult<uint64_t> BatchCacheAgents(const std::map<std::string, v1::Agent>& agents, Ttl ttl = std::nullopt);

  // -------------------------------------------------------------------
  // Sessions / coordination
  // -------------------------------------------------------------------

  util::Result CreateSession(const std::string& session_id, const google::protobuf::Struct& data, Ttl ttl = std::nullopt);
  util::ValueResult<std::optional<google::protobuf::Struct>> GetSession(const std::string& session_id);
  // false when the session is gone.
  util::ValueResult<bool> ExtendSession(const std::string& session_id, Ttl ttl = std::nullopt);

  // Expired state reads as absent.
  util::Result SetCoordinationState(const std::string& operation_id, const google::protobuf::Struct& state, Ttl ttl = std::nullopt);
  util::ValueResult<std::optional<google::protobuf::Struct>> GetCoordinationState(const std::string& operation_id);

  // -------------------------------------------------------------------
  // Streams
  // -------------------------------------------------------------------

  // Adds queued_at (unix ms) and queue_id. Returns the stream id.
  util::ValueResult<std::string> QueueTask(const google::protobuf::Struct& task);
  util::ValueResult<std::vector<v1::StreamMessage>> ConsumeTasks(const std::string& group, const std::string& consumer,
                                                                 std::size_t count = 1);
  util::Result AcknowledgeTask(const std::string& group, const std::string& message_id);

  // Adds published_at (unix ms) and event_id.
  util::ValueResult<std::string> PublishEvent(const google::protobuf::Struct& event);
  util::ValueResult<std::vector<v1::StreamMessage>> ConsumeEvents(const std::string& group, const std::string& consumer,
                                                                  std::size_t count = 10);
  util::Result AcknowledgeEvent(const std::string& group, const std::string& message_id);

  // -------------------------------------------------------------------
  // Metrics
  // -------------------------------------------------------------------

  util::ValueResult<int64_t> IncrementMetric(const std::string& name, int64_t delta = 1);
  // 0 when the counter is absent or expired.
  util::ValueResult<int64_t> GetMetric(const std::string& name);

  EphemeralHealth HealthCheck();

 private:
  util::ValueResult<std::string> Append(const std::string& stream, const google::protobuf::Struct& body, const char* time_field,
                                        const char* id_field);
  util::ValueResult<std::vector<v1::StreamMessage>> Read(const std::string& stream, const std::string& group,
                                                         const std::string& consumer, std::size_t count);
  util::Result Ack(const std::string& stream, const std::string& group, const std::string& message_id);

  std::shared_ptr<Backend>  backend_;
  config::EphemeralSettings settings_;
};

} // namespace hivestate::ephemeral
