#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>

#include "channel_buffer.hpp"

namespace callscribe::audio {

/*
  Writes a one-sample silent keep-alive chunk into every channel that has
  been idle for a whole interval, so a silent party never stalls the
  synchronizer or the recognition session.
*/
class KeepAliveInjector {
 public:
  KeepAliveInjector(std::array<ChannelBuffer*, kChannelCount> buffers, std::chrono::milliseconds interval);

  // One check; returns the number of chunks injected.
  std::size_t Tick(std::chrono::steady_clock::time_point now);

  // Ticks until `stop` is set or every buffer is closed.
  void Run(const std::atomic<bool>& stop);

 private:
  std::array<ChannelBuffer*, kChannelCount>                         buffers_;
  std::chrono::milliseconds                                         interval_;
  std::array<std::chrono::steady_clock::time_point, kChannelCount> last_injected_{};
};

} // namespace callscribe::audio
