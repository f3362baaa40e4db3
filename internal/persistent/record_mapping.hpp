#pragma once

#include <string>
#include <vector>

#include "hivestate/state/v1.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace hivestate::persistent {

namespace v1 = hivestate::state::v1;

/*
  Storage record <-> domain message mapping.

  Document columns are JSON text in records and typed messages outside.
  Malformed stored documents map to empty values instead of failing reads.
*/

v1::Agent          ToAgent(const db::model::AgentRecord& record);
v1::Task           ToTask(const db::model::TaskRecord& record);
v1::SystemSnapshot ToSnapshot(const db::model::SnapshotRecord& record);
v1::Checkpoint     ToCheckpoint(const db::model::CheckpointRecord& record);

db::model::TaskRecord     ToTaskRecord(const v1::NewTask& task);
db::model::SnapshotRecord ToSnapshotRecord(const v1::SystemSnapshot& snapshot);

std::string CapabilitiesToJson(const std::vector<std::string>& capabilities);
std::string MetricsToJson(const google::protobuf::Map<std::string, double>& metrics);

} // namespace hivestate::persistent
