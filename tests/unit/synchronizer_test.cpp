#include "internal/audio/synchronizer.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <vector>

namespace {

using callscribe::audio::AudioChunk;
using callscribe::audio::Channel;
using callscribe::audio::ChannelBuffer;
using callscribe::audio::InterleavedFrame;
using callscribe::audio::Synchronizer;
using callscribe::audio::SynchronizerOptions;

constexpr std::size_t kPeriod = 800; // 100 ms at 8 kHz

AudioChunk Chunk(Channel channel, std::int64_t timestamp_us, std::size_t samples, int16_t value) {
  AudioChunk chunk;
  chunk.channel      = channel;
  chunk.timestamp_us = timestamp_us;
  chunk.samples.assign(samples, value);
  return chunk;
}

AudioChunk KeepAlive(Channel channel) {
  AudioChunk chunk;
  chunk.channel    = channel;
  chunk.keep_alive = true;
  chunk.samples.assign(1, 0);
  return chunk;
}

int16_t At(const InterleavedFrame& frame, std::size_t index, Channel channel) {
  return frame.samples[index * 2 + static_cast<std::size_t>(channel)];
}

void TestEveryFrameIsOnePeriod() {
  Synchronizer sync(SynchronizerOptions{});
  assert(sync.PeriodSamples() == kPeriod);

  // nothing on either channel: one silent frame
  auto frames = sync.Flush({});
  assert(frames.size() == 1);
  assert(frames[0].FrameCount() == kPeriod);
  for (auto s : frames[0].samples) assert(s == 0);

  frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, kPeriod, 5)}, std::vector<AudioChunk>{Chunk(Channel::kAgent, 0, kPeriod, 6)}});
  assert(frames.size() == 1);
  assert(frames[0].FrameCount() == kPeriod);
  assert(At(frames[0], 0, Channel::kCaller) == 5);
  assert(At(frames[0], 0, Channel::kAgent) == 6);
  assert(At(frames[0], kPeriod - 1, Channel::kAgent) == 6);
}

void TestLeadingChannelWaitsOnePeriod() {
  Synchronizer sync(SynchronizerOptions{});

  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, kPeriod, 1)}, {}});
  assert(frames.empty());

  frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 100000, kPeriod, 2)}, {}});
  assert(frames.size() == 1);
  assert(At(frames[0], 0, Channel::kCaller) == 1);
  assert(At(frames[0], 0, Channel::kAgent) == 0);

  // the agent's audio for the held period still lines up
  frames = sync.Flush({{{}, std::vector<AudioChunk>{Chunk(Channel::kAgent, 100000, kPeriod, 3)}}});
  assert(frames.size() == 1);
  assert(At(frames[0], 10, Channel::kCaller) == 2);
  assert(At(frames[0], 10, Channel::kAgent) == 3);
}

void TestSilentChannelWithKeepAliveDoesNotHold() {
  Synchronizer sync(SynchronizerOptions{});

  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, kPeriod, 4)}, std::vector<AudioChunk>{KeepAlive(Channel::kAgent)}});
  assert(frames.size() == 1);
  assert(At(frames[0], 0, Channel::kCaller) == 4);
  assert(At(frames[0], kPeriod - 1, Channel::kAgent) == 0);
}

void TestLateChunkKeepsArrivalOrder() {
  Synchronizer sync(SynchronizerOptions{});

  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, kPeriod / 2, 1), Chunk(Channel::kCaller, 0, kPeriod / 2, 2)},
                            std::vector<AudioChunk>{Chunk(Channel::kAgent, 0, kPeriod, 9)}});
  assert(frames.size() == 1);
  assert(At(frames[0], 0, Channel::kCaller) == 1);
  assert(At(frames[0], kPeriod / 2 - 1, Channel::kCaller) == 1);
  assert(At(frames[0], kPeriod / 2, Channel::kCaller) == 2);
  assert(At(frames[0], kPeriod - 1, Channel::kCaller) == 2);
}

void TestGapsAreSilenceAndLongGapsReanchor() {
  Synchronizer sync(SynchronizerOptions{});

  // 400 samples, then a chunk at 75 ms: 200 samples of silence in between
  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, 400, 1), Chunk(Channel::kCaller, 75000, 200, 2)},
                            std::vector<AudioChunk>{Chunk(Channel::kAgent, 0, kPeriod, 9)}});
  assert(frames.size() == 1);
  assert(At(frames[0], 399, Channel::kCaller) == 1);
  assert(At(frames[0], 400, Channel::kCaller) == 0);
  assert(At(frames[0], 599, Channel::kCaller) == 0);
  assert(At(frames[0], 600, Channel::kCaller) == 2);

  // a 10 s jump is not padded with silence
  frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 10000000, kPeriod, 3)}, std::vector<AudioChunk>{Chunk(Channel::kAgent, 100000, kPeriod, 8)}});
  assert(frames.size() == 1);
  assert(At(frames[0], 0, Channel::kCaller) == 3);
  assert(At(frames[0], 0, Channel::kAgent) == 8);
}

void TestOriginIsEarliestChunk() {
  Synchronizer sync(SynchronizerOptions{});

  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 1000000, kPeriod, 1)},
                            std::vector<AudioChunk>{Chunk(Channel::kAgent, 1050000, kPeriod, 2)}});
  assert(frames.size() == 1);
  assert(frames[0].start_us == 1000000);
  assert(At(frames[0], 399, Channel::kAgent) == 0);
  assert(At(frames[0], 400, Channel::kAgent) == 2);
}

void TestSilenceBeforeFirstChunkDoesNotShiftTimeline() {
  Synchronizer sync(SynchronizerOptions{});

  assert(sync.Flush({}).size() == 1);
  assert(sync.Flush({{{}, std::vector<AudioChunk>{KeepAlive(Channel::kAgent)}}}).size() == 1);

  auto frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 2000000, kPeriod, 7)},
                            std::vector<AudioChunk>{Chunk(Channel::kAgent, 2000000, kPeriod, 8)}});
  assert(frames.size() == 1);
  assert(frames[0].start_us == 2000000);
  assert(At(frames[0], 0, Channel::kCaller) == 7);
  assert(At(frames[0], 0, Channel::kAgent) == 8);

  frames = sync.Flush({std::vector<AudioChunk>{Chunk(Channel::kCaller, 2100000, kPeriod, 9)},
                       std::vector<AudioChunk>{Chunk(Channel::kAgent, 2100000, kPeriod, 9)}});
  assert(frames.size() == 1);
  assert(frames[0].start_us == 2100000);
  assert(At(frames[0], 0, Channel::kCaller) == 9);
}

void TestDrainPadsToWholeFrame() {
  Synchronizer sync(SynchronizerOptions{});

  auto frames = sync.Drain({std::vector<AudioChunk>{Chunk(Channel::kCaller, 0, 1000, 7)}, {}});
  assert(frames.size() == 2);
  assert(frames[1].FrameCount() == kPeriod);
  assert(At(frames[1], 199, Channel::kCaller) == 7);
  assert(At(frames[1], 200, Channel::kCaller) == 0);
  assert(sync.FramesEmitted() == 2);
}

void TestRunDeliversEverythingUntilClosed() {
  SynchronizerOptions options;
  options.period_ms = 20;
  Synchronizer sync(options);

  ChannelBuffer caller(Channel::kCaller, 64);
  ChannelBuffer agent(Channel::kAgent, 64);
  for (int i = 0; i < 10; ++i) {
    assert(caller.Push(Chunk(Channel::kCaller, i * 20000, 160, 1), std::chrono::milliseconds(0)));
    assert(agent.Push(Chunk(Channel::kAgent, i * 20000, 160, 2), std::chrono::milliseconds(0)));
  }
  caller.Close();
  agent.Close();

  std::vector<InterleavedFrame> frames;
  std::atomic<bool>             stop{false};
  sync.Run(caller, agent, [&](InterleavedFrame&& frame) { frames.push_back(std::move(frame)); }, stop);

  assert(frames.size() == 10);
  for (const auto& frame : frames) {
    assert(frame.FrameCount() == 160);
    for (std::size_t i = 0; i < frame.FrameCount(); ++i) {
      assert(At(frame, i, Channel::kCaller) == 1);
      assert(At(frame, i, Channel::kAgent) == 2);
    }
  }
}

} // namespace

int main() {
  TestEveryFrameIsOnePeriod();
  TestLeadingChannelWaitsOnePeriod();
  TestSilentChannelWithKeepAliveDoesNotHold();
  TestLateChunkKeepsArrivalOrder();
  TestGapsAreSilenceAndLongGapsReanchor();
  TestOriginIsEarliestChunk();
  TestSilenceBeforeFirstChunkDoesNotShiftTimeline();
  TestDrainPadsToWholeFrame();
  TestRunDeliversEverythingUntilClosed();

  std::cout << "callscribe_unit_synchronizer: pass\n";
  return 0;
}
