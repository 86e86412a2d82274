#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio_types.hpp"
#include "internal/util/bounded_queue.hpp"

namespace callscribe::audio {

/*
  Per-channel queue between a demuxer (single writer) and the synchronizer
  (single reader). The keep-alive injector is the only other writer.
*/
class ChannelBuffer {
 public:
  ChannelBuffer(Channel channel, std::size_t capacity);

  // Waits up to `wait` for room; the chunk is dropped (and counted) otherwise.
  bool Push(AudioChunk chunk, std::chrono::milliseconds wait);

  std::vector<AudioChunk> Drain();

  // The writer is done; buffered chunks stay drainable.
  void Close();
  bool Closed() const;
  bool Empty() const;

  // Time of the last real (non keep-alive) chunk, or of construction.
  std::chrono::steady_clock::time_point LastActivity() const;

  Channel channel() const {
    return channel_;
  }

  std::uint64_t Dropped() const {
    return dropped_;
  }

 private:
  Channel                        channel_;
  util::BoundedQueue<AudioChunk> queue_;
  std::atomic<std::int64_t>      last_activity_ns_;
  std::atomic<std::uint64_t>     dropped_{0};
};

} // namespace callscribe::audio
