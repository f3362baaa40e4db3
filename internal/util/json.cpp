#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace hivestate::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw StoreError(ErrorCode::InvalidArgument, "json encode: " + std::string(status.message()));
  }
  return json;
}

bool FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

bool ParseJsonValue(const std::string& json, google::protobuf::Value* value) {
  if (json.empty()) {
    return false;
  }
  return google::protobuf::util::JsonStringToMessage(json, value).ok();
}

std::string ValueToFlatString(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    return value.string_value();
  }
  return ToJson(value);
}

} // namespace hivestate::util
