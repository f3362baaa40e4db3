#include "ephemeral_store.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/ephemeral/keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace hivestate::ephemeral {

using hivestate::observability::StringField;
using util::ErrorCode;
using util::Result;
using util::ValueResult;

namespace {

template <typename Fn>
auto Guarded(std::string_view op, std::string_view key, Fn&& fn) {
  using R = std::invoke_result_t<Fn&>;
  Result failure;
  try {
    return fn();
  } catch (const util::StoreError& e) {
    failure = e.ToResult();
  } catch (const std::exception& e) {
    failure = Result::Err(ErrorCode::InternalError, e.what());
  }
  HIVESTATE_LOG_ERROR("Ephemeral operation failed", {StringField("op", op), StringField("key", key),
                                                     StringField("code", util::ToString(failure.code)), StringField("error", failure.message)});
  return util::FailWith<R>(std::move(failure));
}

// Cached documents that no longer parse are treated as a miss.
template <typename Message>
std::optional<Message> Decode(const std::optional<std::string>& raw, std::string_view key) {
  if (!raw) {
    return std::nullopt;
  }
  Message message;
  if (!util::FromJson(*raw, &message)) {
    HIVESTATE_LOG_WARN("Discarding unreadable cache entry", {StringField("key", key)});
    return std::nullopt;
  }
  return message;
}

Fields Flatten(const google::protobuf::Struct& body) {
  // Struct fields are unordered; sort for stable stream bodies.
  std::map<std::string, const google::protobuf::Value*> sorted;
  for (const auto& [name, value] : body.fields()) {
    sorted.emplace(name, &value);
  }
  Fields fields;
  fields.reserve(sorted.size());
  for (const auto& [name, value] : sorted) {
    fields.emplace_back(name, util::ValueToFlatString(*value));
  }
  return fields;
}

v1::StreamMessage ToMessage(const std::string& stream, StreamEntry entry) {
  v1::StreamMessage message;
  message.set_message_id(std::move(entry.id));
  message.set_stream(stream);
  auto* fields = message.mutable_fields()->mutable_fields();
  for (auto& [name, raw] : entry.fields) {
    google::protobuf::Value value;
    if (!util::ParseJsonValue(raw, &value)) {
      value.set_string_value(raw);
    }
    (*fields)[name] = std::move(value);
  }
  return message;
}

} // namespace

EphemeralStore::EphemeralStore(std::shared_ptr<Backend> backend, config::EphemeralSettings settings)
    : backend_(std::move(backend)), settings_(std::move(settings)) {
  if (!backend_) {
    throw std::invalid_argument("EphemeralStore: backend is null");
  }
}

Result EphemeralStore::Initialize() {
  const std::pair<std::string_view, std::string_view> groups[] = {
      {keys::kTasksStream, keys::kTaskProcessors},
      {keys::kTasksStream, keys::kPriorityProcessors},
      {keys::kEventsStream, keys::kMonitoring},
      {keys::kEventsStream, keys::kAnalytics},
  };

  return Guarded("Initialize", "", [&] {
    for (const auto& [stream, group] : groups) {
      if (backend_->XGroupCreate(std::string(stream), std::string(group))) {
        HIVESTATE_LOG_INFO("Created consumer group", {StringField("stream", stream), StringField("group", group)});
      }
    }
    return Result::Ok();
  });
}

// ---------------------------------------------------------------------
// Cache
// ---------------------------------------------------------------------

Result EphemeralStore::SetAgentState(const v1::Agent& agent, Ttl ttl) {
  const auto key = keys::AgentState(agent.agent_id());
  return Guarded("SetAgentState", key, [&] {
    backend_->SetEx(key, util::ToJson(agent), ttl.value_or(settings_.default_ttl));
    return Result::Ok();
  });
}

ValueResult<std::optional<v1::Agent>> EphemeralStore::GetAgentState(const std::string& agent_id) {
  const auto key = keys::AgentState(agent_id);
  return Guarded("GetAgentState", key, [&] {
    return ValueResult<std::optional<v1::Agent>>::Ok(Decode<v1::Agent>(backend_->Get(key), key));
  });
}

Result EphemeralStore::DeleteAgentState(const std::string& agent_id) {
  const auto key = keys::AgentState(agent_id);
  return Guarded("DeleteAgentState", key, [&] {
    backend_->Del(key);
    return Result::Ok();
  });
}

Result EphemeralStore::CacheTask(const v1::Task& task, Ttl ttl) {
  const auto key = keys::TaskCache(task.task_id());
  return Guarded("CacheTask", key, [&] {
    backend_->SetEx(key, util::ToJson(task), ttl.value_or(settings_.task_ttl));
    return Result::Ok();
  });
}

ValueResult<std::optional<v1::Task>> EphemeralStore::GetCachedTask(const std::string& task_id) {
  const auto key = keys::TaskCache(task_id);
  return Guarded("GetCachedTask", key, [&] {
    return ValueResult<std::optional<v1::Task>>::Ok(Decode<v1::Task>(backend_->Get(key), key));
  });
}

Result EphemeralStore::DeleteCachedTask(const std::string& task_id) {
  const auto key = keys::TaskCache(task_id);
  return Guarded("DeleteCachedTask", key, [&] {
    backend_->Del(key);
    return Result::Ok();
  });
}

ValueResult<uint64_t> EphemeralStore::BatchCacheAgents(const std::map<std::string, v1::Agent>& agents, Ttl ttl) {
  if (agents.empty()) {
    return ValueResult<uint64_t>::Ok(0);
  }
  return Guarded("BatchCacheAgents", "", [&] {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(agents.size());
    for (const auto& [agent_id, agent] : agents) {
      entries.emplace_back(keys::AgentState(agent_id), util::ToJson(agent));
    }
    backend_->SetExBatch(entries, ttl.value_or(settings_.default_ttl));
    return ValueResult<uint64_t>::Ok(entries.size());
  });
}

// ---------------------------------------------------------------------
// Sessions / coordination
// ---------------------------------------------------------------------

Result EphemeralStore::CreateSession(const std::string& session_id, const google::protobuf::Struct& data, Ttl ttl) {
  const auto key = keys::Session(session_id);
  return Guarded("CreateSession", key, [&] {
    backend_->SetEx(key, util::ToJson(data), ttl.value_or(settings_.session_ttl));
    return Result::Ok();
  });
}

ValueResult<std::optional<google::protobuf::Struct>> EphemeralStore::GetSession(const std::string& session_id) {
  const auto key = keys::Session(session_id);
  return Guarded("GetSession", key, [&] {
    return ValueResult<std::optional<google::protobuf::Struct>>::Ok(Decode<google::protobuf::Struct>(backend_->Get(key), key));
  });
}

ValueResult<bool> EphemeralStore::ExtendSession(const std::string& session_id, Ttl ttl) {
  const auto key = keys::Session(session_id);
  return Guarded("ExtendSession", key,
                 [&] { return ValueResult<bool>::Ok(backend_->Expire(key, ttl.value_or(settings_.session_ttl))); });
}

Result EphemeralStore::SetCoordinationState(const std::string& operation_id, const google::protobuf::Struct& state, Ttl ttl) {
  const auto key = keys::Coordination(operation_id);
  return Guarded("SetCoordinationState", key, [&] {
    backend_->SetEx(key, util::ToJson(state), ttl.value_or(settings_.coordination_ttl));
    return Result::Ok();
  });
}

ValueResult<std::optional<google::protobuf::Struct>> EphemeralStore::GetCoordinationState(const std::string& operation_id) {
  const auto key = keys::Coordination(operation_id);
  return Guarded("GetCoordinationState", key, [&] {
    return ValueResult<std::optional<google::protobuf::Struct>>::Ok(Decode<google::protobuf::Struct>(backend_->Get(key), key));
  });
}

// ---------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------

ValueResult<std::string> EphemeralStore::Append(const std::string& stream, const google::protobuf::Struct& body, const char* time_field,
                                                const char* id_field) {
  return Guarded("XADD", stream, [&] {
    google::protobuf::Struct stamped = body;
    (*stamped.mutable_fields())[time_field].set_string_value(std::to_string(util::NowMillis()));
    (*stamped.mutable_fields())[id_field].set_string_value(util::NewId());
    return ValueResult<std::string>::Ok(backend_->XAdd(stream, Flatten(stamped), settings_.stream_maxlen));
  });
}

ValueResult<std::vector<v1::StreamMessage>> EphemeralStore::Read(const std::string& stream, const std::string& group,
                                                                 const std::string& consumer, std::size_t count) {
  return Guarded("XREADGROUP", stream, [&] {
    std::vector<v1::StreamMessage> messages;
    for (auto& entry : backend_->XReadGroup(stream, group, consumer, count, settings_.block_timeout)) {
      messages.push_back(ToMessage(stream, std::move(entry)));
    }
    return ValueResult<std::vector<v1::StreamMessage>>::Ok(std::move(messages));
  });
}

Result EphemeralStore::Ack(const std::string& stream, const std::string& group, const std::string& message_id) {
  return Guarded("XACK", stream, [&] {
    if (!backend_->XAck(stream, group, message_id)) {
      return Result::Err(ErrorCode::NotFound, "message not pending: " + message_id);
    }
    return Result::Ok();
  });
}

ValueResult<std::string> EphemeralStore::QueueTask(const google::protobuf::Struct& task) {
  return Append(std::string(keys::kTasksStream), task, "queued_at", "queue_id");
}

ValueResult<std::vector<v1::StreamMessage>> EphemeralStore::ConsumeTasks(const std::string& group, const std::string& consumer,
                                                                         std::size_t count) {
  return Read(std::string(keys::kTasksStream), group, consumer, count);
}

Result EphemeralStore::AcknowledgeTask(const std::string& group, const std::string& message_id) {
  return Ack(std::string(keys::kTasksStream), group, message_id);
}

ValueResult<std::string> EphemeralStore::PublishEvent(const google::protobuf::Struct& event) {
  return Append(std::string(keys::kEventsStream), event, "published_at", "event_id");
}

ValueResult<std::vector<v1::StreamMessage>> EphemeralStore::ConsumeEvents(const std::string& group, const std::string& consumer,
                                                                          std::size_t count) {
  return Read(std::string(keys::kEventsStream), group, consumer, count);
}

Result EphemeralStore::AcknowledgeEvent(const std::string& group, const std::string& message_id) {
  return Ack(std::string(keys::kEventsStream), group, message_id);
}

// ---------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------

ValueResult<int64_t> EphemeralStore::IncrementMetric(const std::string& name, int64_t delta) {
  const auto key = keys::Metric(name);
  return Guarded("IncrementMetric", key,
                 [&] { return ValueResult<int64_t>::Ok(backend_->IncrBy(key, delta, settings_.metric_ttl)); });
}

ValueResult<int64_t> EphemeralStore::GetMetric(const std::string& name) {
  const auto key = keys::Metric(name);
  return Guarded("GetMetric", key, [&] {
    auto raw = backend_->Get(key);
    if (!raw) {
      return ValueResult<int64_t>::Ok(0);
    }
    int64_t value  = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size()) {
      return ValueResult<int64_t>::Err(ErrorCode::Corruption, "counter is not an integer: " + key);
    }
    return ValueResult<int64_t>::Ok(value);
  });
}

// ---------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------

EphemeralHealth EphemeralStore::HealthCheck() {
  EphemeralHealth health;
  try {
    const auto started = std::chrono::steady_clock::now();
    backend_->Ping();
    health.ping_ms   = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    health.connected = true;

    health.used_memory_bytes = backend_->UsedMemory();
    for (auto stream : {keys::kTasksStream, keys::kEventsStream}) {
      health.stream_lengths[std::string(stream)] = backend_->XLen(std::string(stream));
    }
  } catch (const std::exception& e) {
    health.error = e.what();
    HIVESTATE_LOG_WARN("Ephemeral store health check failed", {StringField("error", e.what())});
  }
  return health;
}

} // namespace hivestate::ephemeral
