#include "record_mapping.hpp"

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace hivestate::persistent {

v1::Agent ToAgent(const db::model::AgentRecord& record) {
  v1::Agent agent;
  agent.set_agent_id(record.agent_id);
  agent.set_status(record.status);
  agent.set_current_task_id(record.current_task_id);
  agent.set_context_usage(record.context_usage);
  *agent.mutable_last_activity() = util::MillisToProto(record.last_activity_ms);
  *agent.mutable_created_at()    = util::MillisToProto(record.created_at_ms);
  *agent.mutable_updated_at()    = util::MillisToProto(record.updated_at_ms);

  google::protobuf::ListValue capabilities;
  if (util::FromJson(record.capabilities_json, &capabilities)) {
    for (const auto& value : capabilities.values()) {
      if (value.kind_case() == google::protobuf::Value::kStringValue) {
        agent.add_capabilities(value.string_value());
      }
    }
  }

  google::protobuf::Struct metrics;
  if (util::FromJson(record.performance_metrics_json, &metrics)) {
    for (const auto& [name, value] : metrics.fields()) {
      if (value.kind_case() == google::protobuf::Value::kNumberValue) {
        (*agent.mutable_performance_metrics())[name] = value.number_value();
      }
    }
  }
  return agent;
}

v1::Task ToTask(const db::model::TaskRecord& record) {
  v1::Task task;
  task.set_task_id(record.task_id);
  task.set_status(record.status);
  task.set_agent_id(record.agent_id);
  task.set_priority(record.priority);
  *task.mutable_created_at()   = util::MillisToProto(record.created_at_ms);
  *task.mutable_started_at()   = util::MillisToProto(record.started_at_ms);
  *task.mutable_completed_at() = util::MillisToProto(record.completed_at_ms);

  if (!util::FromJson(record.metadata_json, task.mutable_metadata())) {
    task.clear_metadata();
  }
  if (!record.result_json.empty() && !util::ParseJsonValue(record.result_json, task.mutable_result())) {
    task.clear_result();
  }
  return task;
}

v1::SystemSnapshot ToSnapshot(const db::model::SnapshotRecord& record) {
  v1::SystemSnapshot snapshot;
  snapshot.set_id(record.id);
  *snapshot.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  snapshot.set_total_agents(record.total_agents);
  snapshot.set_active_agents(record.active_agents);
  snapshot.set_total_tasks(record.total_tasks);
  snapshot.set_completed_tasks(record.completed_tasks);
  snapshot.set_failed_tasks(record.failed_tasks);
  snapshot.set_average_context_usage(record.average_context_usage);
  snapshot.set_quality_score(record.quality_score);
  if (!util::FromJson(record.metadata_json, snapshot.mutable_metadata())) {
    snapshot.clear_metadata();
  }
  return snapshot;
}

v1::Checkpoint ToCheckpoint(const db::model::CheckpointRecord& record) {
  v1::Checkpoint checkpoint;
  checkpoint.set_id(record.id);
  checkpoint.set_name(record.name);
  *checkpoint.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  if (!util::FromJson(record.data_json, checkpoint.mutable_data())) {
    checkpoint.clear_data();
  }
  return checkpoint;
}

db::model::TaskRecord ToTaskRecord(const v1::NewTask& task) {
  db::model::TaskRecord record;
  record.task_id         = task.task_id();
  record.status          = task.has_status() ? task.status() : v1::TASK_STATUS_PENDING;
  record.agent_id        = task.agent_id();
  record.priority        = task.has_priority() ? task.priority() : 5;
  record.created_at_ms   = util::ProtoToMillis(task.created_at());
  record.started_at_ms   = util::ProtoToMillis(task.started_at());
  record.completed_at_ms = util::ProtoToMillis(task.completed_at());
  record.metadata_json   = util::ToJson(task.metadata());
  if (task.has_result()) {
    record.result_json = util::ToJson(task.result());
  }
  return record;
}

db::model::SnapshotRecord ToSnapshotRecord(const v1::SystemSnapshot& snapshot) {
  db::model::SnapshotRecord record;
  record.timestamp_ms          = util::ProtoToMillis(snapshot.timestamp());
  record.total_agents          = snapshot.total_agents();
  record.active_agents         = snapshot.active_agents();
  record.total_tasks           = snapshot.total_tasks();
  record.completed_tasks       = snapshot.completed_tasks();
  record.failed_tasks          = snapshot.failed_tasks();
  record.average_context_usage = snapshot.average_context_usage();
  record.quality_score         = snapshot.quality_score();
  record.metadata_json         = util::ToJson(snapshot.metadata());
  return record;
}

std::string CapabilitiesToJson(const std::vector<std::string>& capabilities) {
  google::protobuf::ListValue list;
  for (const auto& capability : capabilities) {
    list.add_values()->set_string_value(capability);
  }
  return util::ToJson(list);
}

std::string MetricsToJson(const google::protobuf::Map<std::string, double>& metrics) {
  google::protobuf::Struct doc;
  for (const auto& [name, value] : metrics) {
    (*doc.mutable_fields())[name].set_number_value(value);
  }
  return util::ToJson(doc);
}

} // namespace hivestate::persistent
