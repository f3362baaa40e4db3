#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <string>

namespace hivestate::util {

/*
  protobuf <-> JSON helpers.

  ToJson throws StoreError(InvalidArgument) on failure; FromJson reports it
  through its return value.
*/

std::string ToJson(const google::protobuf::Message& message);

bool FromJson(const std::string& json, google::protobuf::Message* message);

// Any JSON text into a Value; false on malformed input.
bool ParseJsonValue(const std::string& json, google::protobuf::Value* value);

// Value holding a plain string is returned as-is, anything else as JSON.
std::string ValueToFlatString(const google::protobuf::Value& value);

} // namespace hivestate::util
