#pragma once

#include <string>
#include <string_view>

namespace hivestate::ephemeral::keys {

inline constexpr std::string_view kTasksStream  = "tasks:pending";
inline constexpr std::string_view kEventsStream = "events:system";

inline constexpr std::string_view kTaskProcessors     = "task_processors";
inline constexpr std::string_view kPriorityProcessors = "priority_processors";
inline constexpr std::string_view kMonitoring         = "monitoring";
inline constexpr std::string_view kAnalytics          = "analytics";

inline std::string AgentState(std::string_view agent_id) {
  return "agent:state:" + std::string(agent_id);
}

inline std::string TaskCache(std::string_view task_id) {
  return "task:cache:" + std::string(task_id);
}

inline std::string Coordination(std::string_view operation_id) {
  return "coord:" + std::string(operation_id);
}

inline std::string Session(std::string_view session_id) {
  return "session:" + std::string(session_id);
}

inline std::string Metric(std::string_view name) {
  return "metrics:" + std::string(name);
}

} // namespace hivestate::ephemeral::keys
