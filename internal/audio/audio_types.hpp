#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe::audio {

enum class Channel : std::uint8_t {
  kCaller = 0,
  kAgent  = 1,
};

constexpr std::size_t kChannelCount = 2;

constexpr std::size_t Index(Channel channel) {
  return static_cast<std::size_t>(channel);
}

constexpr Channel Other(Channel channel) {
  return channel == Channel::kCaller ? Channel::kAgent : Channel::kCaller;
}

constexpr std::string_view ToString(Channel channel) {
  return channel == Channel::kCaller ? "caller" : "agent";
}

/*
  Timestamped mono s16 samples for one channel.

  Keep-alive chunks carry no timestamp and only mark the channel as alive.
*/
struct AudioChunk {
  Channel              channel      = Channel::kCaller;
  std::int64_t         timestamp_us = 0;
  std::string          fragment;
  std::vector<int16_t> samples;
  bool                 keep_alive = false;
};

/*
  Two-channel interleaved PCM (caller, agent, caller, agent, ...).
  Always exactly one interleave period long.
*/
struct InterleavedFrame {
  std::int64_t         start_us = 0;
  std::vector<int16_t> samples;

  std::size_t FrameCount() const {
    return samples.size() / kChannelCount;
  }

  // little-endian s16 bytes, as recorded and streamed
  std::string ToBytes() const;
};

// Decodes little-endian s16 PCM; a trailing odd byte is dropped.
std::vector<int16_t> DecodePcm16(std::string_view bytes);

} // namespace callscribe::audio
