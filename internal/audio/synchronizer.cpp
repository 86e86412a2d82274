#include "synchronizer.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace callscribe::audio {

using observability::IntField;
using observability::StringField;

Synchronizer::Synchronizer(SynchronizerOptions options)
    : options_(options),
      period_samples_(static_cast<std::size_t>(static_cast<std::uint64_t>(options.sample_rate_hz) * options.period_ms / 1000)),
      max_gap_samples_(static_cast<std::int64_t>(static_cast<std::uint64_t>(options.sample_rate_hz) * options.max_gap_ms / 1000)) {
  if (period_samples_ == 0) {
    throw std::invalid_argument("interleave period must cover at least one sample");
  }
}

Synchronizer::Activity Synchronizer::Absorb(const Drained& drained) {
  Activity activity;

  if (!anchored_) {
    std::int64_t first = std::numeric_limits<std::int64_t>::max();
    for (const auto& chunks : drained) {
      for (const auto& chunk : chunks) {
        if (!chunk.keep_alive) {
          first = std::min(first, chunk.timestamp_us);
          break;
        }
      }
    }
    if (first != std::numeric_limits<std::int64_t>::max()) {
      anchored_  = true;
      origin_us_ = first;
      // silent frames sent before the first audio are not part of the timeline
      emitted_ = 0;
    }
  }

  for (std::size_t c = 0; c < kChannelCount; ++c) {
    for (const auto& chunk : drained[c]) {
      if (chunk.keep_alive) {
        activity.keep_alive[c] = true;
        continue;
      }
      Place(c, chunk);
      activity.has_audio[c] = true;
    }
  }
  return activity;
}

std::vector<InterleavedFrame> Synchronizer::Flush(Drained drained) {
  const Activity activity = Absorb(drained);
  const auto&    has_audio  = activity.has_audio;
  const auto&    keep_alive = activity.keep_alive;

  // a channel known to be silent (keep-alive, nothing buffered) does not hold the other back
  std::size_t fastest = 0;
  std::size_t slowest = std::numeric_limits<std::size_t>::max();
  for (std::size_t c = 0; c < kChannelCount; ++c) {
    const auto available = lanes_[c].pending.size();
    fastest              = std::max(fastest, available);
    if (!(keep_alive[c] && available == 0)) {
      slowest = std::min(slowest, available);
    }
  }
  if (slowest == std::numeric_limits<std::size_t>::max()) slowest = fastest;

  const std::size_t ready  = std::max(slowest, fastest > period_samples_ ? fastest - period_samples_ : 0);
  std::size_t       frames = ready / period_samples_;

  if (frames == 0 && !has_audio[0] && !has_audio[1]) {
    frames = 1;
  }
  return Emit(frames);
}

std::vector<InterleavedFrame> Synchronizer::Drain(Drained remaining) {
  Absorb(remaining);
  std::size_t held = 0;
  for (const auto& lane : lanes_) held = std::max(held, lane.pending.size());
  return Emit((held + period_samples_ - 1) / period_samples_);
}

void Synchronizer::Place(std::size_t channel, const AudioChunk& chunk) {
  auto&              lane      = lanes_[channel];
  const std::int64_t write_pos = emitted_ + static_cast<std::int64_t>(lane.pending.size());
  std::int64_t       index     = util::MicrosToSamples(chunk.timestamp_us - origin_us_, options_.sample_rate_hz) - lane.shift;

  if (index < write_pos) {
    // late or overlapping: keep arrival order
    index = write_pos;
  } else if (index - write_pos > max_gap_samples_) {
    lane.shift += index - write_pos;
    CALLSCRIBE_LOG_INFO("Re-anchoring channel after gap", {StringField("channel", ToString(static_cast<Channel>(channel))),
                                                           IntField("gap_ms", util::SamplesToMicros(index - write_pos, options_.sample_rate_hz) / 1000)});
    index = write_pos;
  }

  lane.pending.insert(lane.pending.end(), static_cast<std::size_t>(index - write_pos), 0);
  lane.pending.insert(lane.pending.end(), chunk.samples.begin(), chunk.samples.end());
}

std::vector<InterleavedFrame> Synchronizer::Emit(std::size_t frames) {
  std::vector<InterleavedFrame> out;
  out.reserve(frames);
  for (std::size_t f = 0; f < frames; ++f) {
    InterleavedFrame frame;
    frame.start_us = origin_us_ + util::SamplesToMicros(emitted_, options_.sample_rate_hz);
    frame.samples.resize(period_samples_ * kChannelCount, 0);
    for (std::size_t c = 0; c < kChannelCount; ++c) {
      auto&             pending = lanes_[c].pending;
      const std::size_t take    = std::min(pending.size(), period_samples_);
      for (std::size_t i = 0; i < take; ++i) {
        frame.samples[i * kChannelCount + c] = pending[i];
      }
      pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(take));
    }
    emitted_ += static_cast<std::int64_t>(period_samples_);
    ++frames_emitted_;
    out.push_back(std::move(frame));
  }
  return out;
}

void Synchronizer::Run(ChannelBuffer& caller, ChannelBuffer& agent, const FrameSink& sink, const std::atomic<bool>& stop) {
  const auto period = std::chrono::milliseconds(options_.period_ms);
  auto       next   = std::chrono::steady_clock::now() + period;

  auto deliver = [&](std::vector<InterleavedFrame> frames) {
    for (auto& frame : frames) sink(std::move(frame));
  };

  while (!stop.load()) {
    std::this_thread::sleep_until(next);
    next += period;

    const bool finished = caller.Closed() && agent.Closed();
    deliver(Flush({caller.Drain(), agent.Drain()}));
    if (finished && caller.Empty() && agent.Empty()) break;
  }

  deliver(Drain({caller.Drain(), agent.Drain()}));

  CALLSCRIBE_LOG_INFO("Synchronizer stopped", {IntField("frames", static_cast<int64_t>(frames_emitted_)),
                                               IntField("period_samples", static_cast<int64_t>(period_samples_))});
}

} // namespace callscribe::audio
