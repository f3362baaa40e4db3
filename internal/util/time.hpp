#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace hivestate::util {

/*
  Time utilities. Single place to control the clock source.

  Storage records carry unix milliseconds; 0 means "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 0 maps to an unset (default) Timestamp and back.
google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// UTC, e.g. 2024-05-01T12:30:00Z
std::string ToIso8601(TimePoint tp);

} // namespace hivestate::util
