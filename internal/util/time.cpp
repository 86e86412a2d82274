#include "time.hpp"

namespace callscribe::util {

TimePoint Now() {
  return Clock::now();
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

int64_t MicrosToSamples(int64_t us, uint32_t sample_rate_hz) {
  return us * static_cast<int64_t>(sample_rate_hz) / 1000000;
}

int64_t SamplesToMicros(int64_t samples, uint32_t sample_rate_hz) {
  if (sample_rate_hz == 0) {
    return 0;
  }
  return samples * 1000000 / static_cast<int64_t>(sample_rate_hz);
}

} // namespace callscribe::util
