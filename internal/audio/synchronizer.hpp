#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include "audio_types.hpp"
#include "channel_buffer.hpp"

namespace callscribe::audio {

struct SynchronizerOptions {
  std::uint32_t sample_rate_hz = 8000;
  std::uint32_t period_ms      = 100;
  std::uint32_t max_gap_ms     = 5000;
};

using FrameSink = std::function<void(InterleavedFrame&&)>;

/*
  Aligns caller and agent audio on a common time axis and emits fixed-size
  interleaved frames.

  The output timeline starts at the earliest chunk timestamp seen on either
  channel. Every chunk lands at the sample offset of its timestamp; gaps are
  silence. Frames are emitted whole, one period each; audio of a channel that
  is ahead waits at most one period for a lagging channel. Late or
  overlapping chunks are appended after the channel's last written sample so
  that order within a channel never changes.
*/
class Synchronizer {
 public:
  explicit Synchronizer(SynchronizerOptions options);

  using Drained = std::array<std::vector<AudioChunk>, kChannelCount>;

  // One flush. Always yields at least one frame when no audio arrived.
  std::vector<InterleavedFrame> Flush(Drained drained);

  // Takes the last chunks, then emits everything held, padded to a whole frame.
  std::vector<InterleavedFrame> Drain(Drained remaining = {});

  /*
    Flushes both buffers every period until both are closed and empty, then
    drains. `stop` ends the loop early (the buffers are still drained once).
  */
  void Run(ChannelBuffer& caller, ChannelBuffer& agent, const FrameSink& sink, const std::atomic<bool>& stop);

  std::size_t PeriodSamples() const {
    return period_samples_;
  }

  std::uint64_t FramesEmitted() const {
    return frames_emitted_;
  }

 private:
  struct Lane {
    std::deque<int16_t> pending;
    // samples dropped from the timeline after a re-anchor
    std::int64_t shift = 0;
  };

  struct Activity {
    std::array<bool, kChannelCount> has_audio{};
    std::array<bool, kChannelCount> keep_alive{};
  };

  Activity                      Absorb(const Drained& drained);
  void                          Place(std::size_t channel, const AudioChunk& chunk);
  std::vector<InterleavedFrame> Emit(std::size_t frames);

  SynchronizerOptions options_;
  std::size_t         period_samples_;
  std::int64_t        max_gap_samples_;

  bool                            anchored_  = false;
  std::int64_t                    origin_us_ = 0;
  std::int64_t                    emitted_   = 0;
  std::array<Lane, kChannelCount> lanes_;
  std::uint64_t                   frames_emitted_ = 0;
};

} // namespace callscribe::audio
