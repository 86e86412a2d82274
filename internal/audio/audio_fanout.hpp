#pragma once

#include <arrow/io/file.h>

#include <cstdint>
#include <memory>
#include <string>

#include "audio_pipe.hpp"
#include "audio_types.hpp"

namespace callscribe::audio {

/*
  Local raw recording of one work unit: interleaved s16le PCM appended to a
  temp file, uploaded by the recording finalizer.
*/
class LocalRecording {
 public:
  explicit LocalRecording(std::string path);
  ~LocalRecording();

  LocalRecording(const LocalRecording&)            = delete;
  LocalRecording& operator=(const LocalRecording&) = delete;

  void Append(const std::string& pcm);
  void Close();

  const std::string& Path() const {
    return path_;
  }

  std::uint64_t BytesWritten() const {
    return bytes_written_;
  }

 private:
  std::string                                 path_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  std::uint64_t                               bytes_written_ = 0;
};

/*
  Sends every interleaved frame to the local recording and to the
  recognition session's audio pipe. Recording failures disable recording for
  the rest of the work unit; they never interrupt streaming.
*/
class AudioFanOut {
 public:
  // `recording` may be null when the call is not recorded.
  AudioFanOut(std::shared_ptr<LocalRecording> recording, std::shared_ptr<AudioPipe> pipe);

  void Deliver(InterleavedFrame&& frame);

  // Closes the pipe (ends the session's input) and the recording.
  void Close();

  std::uint64_t FramesDelivered() const {
    return frames_;
  }

 private:
  std::shared_ptr<LocalRecording> recording_;
  std::shared_ptr<AudioPipe>      pipe_;
  std::uint64_t                   frames_ = 0;
};

} // namespace callscribe::audio
