#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace hivestate::util {

/*
  UUID helpers

  Random RFC4122 version 4 ids used for task ids, queue correlation ids
  and event ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace hivestate::util
