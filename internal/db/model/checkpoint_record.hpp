#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hivestate::db::model {

struct CheckpointRecord {
  uint64_t    id = 0;
  std::string name;
  uint64_t    timestamp_ms = 0;
  std::string data_json    = "{}";
};

// Newest first. Unset bounds are open.
struct CheckpointQuery {
  std::optional<std::string> name;
  std::optional<uint64_t>    since_ms;
  std::optional<uint64_t>    until_ms;
  uint64_t                   limit = 100;
};

} // namespace hivestate::db::model
