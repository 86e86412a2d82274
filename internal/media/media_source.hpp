#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace callscribe::media {

/*
  Long-lived byte stream of one live media source.
*/
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  /*
    Reads up to max_bytes, waiting at most `wait` for data.

    std::nullopt  -> the stream ended (or was closed)
    empty string  -> nothing arrived within `wait`
  */
  virtual std::optional<std::string> Read(std::size_t max_bytes, std::chrono::milliseconds wait) = 0;

  // Unblocks pending reads; later reads report end of stream.
  virtual void Close() = 0;
};

class MediaSource {
 public:
  virtual ~MediaSource() = default;

  // resume_marker is empty for a fresh call.
  virtual std::unique_ptr<ByteStream> Open(const std::string& source_id, const std::string& resume_marker) = 0;
};

} // namespace callscribe::media
