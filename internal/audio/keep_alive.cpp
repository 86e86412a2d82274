#include "keep_alive.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"

namespace callscribe::audio {

KeepAliveInjector::KeepAliveInjector(std::array<ChannelBuffer*, kChannelCount> buffers, std::chrono::milliseconds interval)
    : buffers_(buffers), interval_(interval) {
}

std::size_t KeepAliveInjector::Tick(std::chrono::steady_clock::time_point now) {
  std::size_t injected = 0;
  for (std::size_t c = 0; c < kChannelCount; ++c) {
    auto* buffer = buffers_[c];
    if (!buffer || buffer->Closed()) continue;

    const auto idle_since = std::max(buffer->LastActivity(), last_injected_[c]);
    if (now - idle_since < interval_) continue;

    AudioChunk chunk;
    chunk.channel    = buffer->channel();
    chunk.keep_alive = true;
    chunk.samples.assign(1, 0);
    if (buffer->Push(std::move(chunk), std::chrono::milliseconds(0))) {
      ++injected;
      CALLSCRIBE_LOG_DEBUG("Keep-alive injected", {observability::StringField("channel", ToString(buffer->channel()))});
    }
    last_injected_[c] = now;
  }
  return injected;
}

void KeepAliveInjector::Run(const std::atomic<bool>& stop) {
  const auto step = std::clamp<std::chrono::milliseconds>(interval_ / 4, std::chrono::milliseconds(10), std::chrono::milliseconds(250));
  while (!stop.load()) {
    bool open = false;
    for (auto* buffer : buffers_) open = open || (buffer && !buffer->Closed());
    if (!open) break;

    Tick(std::chrono::steady_clock::now());
    std::this_thread::sleep_for(step);
  }
}

} // namespace callscribe::audio
