#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/bounded_queue.hpp"

namespace callscribe::audio {

/*
  Backpressured hand-off of interleaved PCM from the fan-out stage to the
  recognition session's push loop.
*/
class AudioPipe {
 public:
  AudioPipe(std::size_t capacity, std::chrono::milliseconds push_timeout);

  // Waits up to the push timeout; false means the packet was dropped.
  bool Push(std::string pcm);

  // Blocks until a packet arrives; std::nullopt once closed and drained.
  std::optional<std::string> Pop();

  void Close();
  bool Closed() const;

  std::size_t Depth() const {
    return queue_.Size();
  }

  std::uint64_t Dropped() const {
    return dropped_;
  }

 private:
  util::BoundedQueue<std::string> queue_;
  std::chrono::milliseconds       push_timeout_;
  std::atomic<std::uint64_t>      dropped_{0};
};

} // namespace callscribe::audio
