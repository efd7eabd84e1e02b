#include "time.hpp"

namespace pulse::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto nanos       = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds.count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  return ToProto(TimePoint{std::chrono::milliseconds(ms)});
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

} // namespace pulse::util
