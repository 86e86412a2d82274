#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace callscribe::util {

/*
  Wall-clock helpers and protobuf Timestamp conversion.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Samples of one channel covering `us` microseconds at `sample_rate_hz`.
int64_t MicrosToSamples(int64_t us, uint32_t sample_rate_hz);
int64_t SamplesToMicros(int64_t samples, uint32_t sample_rate_hz);

} // namespace callscribe::util
