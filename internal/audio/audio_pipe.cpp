#include "audio_pipe.hpp"

#include "internal/observability/logging.hpp"

namespace callscribe::audio {

AudioPipe::AudioPipe(std::size_t capacity, std::chrono::milliseconds push_timeout) : queue_(capacity), push_timeout_(push_timeout) {
}

bool AudioPipe::Push(std::string pcm) {
  if (queue_.Push(std::move(pcm), push_timeout_)) {
    return true;
  }
  if (!queue_.Closed() && (dropped_++ % 50) == 0) {
    CALLSCRIBE_LOG_WARN("Recognition audio pipe full, dropping packet",
                        {observability::IntField("dropped", static_cast<int64_t>(dropped_.load())),
                         observability::IntField("depth", static_cast<int64_t>(queue_.Size()))});
  }
  return false;
}

std::optional<std::string> AudioPipe::Pop() {
  return queue_.Pop();
}

void AudioPipe::Close() {
  queue_.Close();
}

bool AudioPipe::Closed() const {
  return queue_.Closed();
}

} // namespace callscribe::audio
