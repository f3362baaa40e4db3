#include "time.hpp"

#include <ctime>

namespace hivestate::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  if (ms == 0) {
    return {};
  }
  return ToProto(FromUnixMillis(ms));
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() <= 0 && ts.nanos() == 0) {
    return 0;
  }
  return ToUnixMillis(FromProto(ts));
}

std::string ToIso8601(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace hivestate::util
