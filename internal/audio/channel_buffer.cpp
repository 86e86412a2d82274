#include "channel_buffer.hpp"

#include "internal/observability/logging.hpp"

namespace callscribe::audio {

namespace {

std::int64_t SteadyNanos(std::chrono::steady_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

} // namespace

ChannelBuffer::ChannelBuffer(Channel channel, std::size_t capacity)
    : channel_(channel), queue_(capacity), last_activity_ns_(SteadyNanos(std::chrono::steady_clock::now())) {
}

bool ChannelBuffer::Push(AudioChunk chunk, std::chrono::milliseconds wait) {
  const bool keep_alive = chunk.keep_alive;
  if (!queue_.Push(std::move(chunk), wait)) {
    if (!queue_.Closed() && (dropped_++ % 100) == 0) {
      CALLSCRIBE_LOG_WARN("Channel buffer full, dropping audio", {observability::StringField("channel", ToString(channel_)),
                                                                  observability::IntField("dropped", static_cast<int64_t>(dropped_.load()))});
    }
    return false;
  }
  if (!keep_alive) {
    last_activity_ns_ = SteadyNanos(std::chrono::steady_clock::now());
  }
  return true;
}

std::vector<AudioChunk> ChannelBuffer::Drain() {
  return queue_.DrainAll();
}

void ChannelBuffer::Close() {
  queue_.Close();
}

bool ChannelBuffer::Closed() const {
  return queue_.Closed();
}

bool ChannelBuffer::Empty() const {
  return queue_.Size() == 0;
}

std::chrono::steady_clock::time_point ChannelBuffer::LastActivity() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::nanoseconds(last_activity_ns_.load())));
}

} // namespace callscribe::audio
