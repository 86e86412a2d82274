#include "audio_fanout.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace callscribe::audio {

using callscribe::storage::common::Unwrap;
using observability::StringField;

LocalRecording::LocalRecording(std::string path) : path_(std::move(path)) {
  out_ = Unwrap(arrow::io::FileOutputStream::Open(path_));
}

LocalRecording::~LocalRecording() {
  if (out_ && !out_->closed()) {
    auto status = out_->Close();
    if (!status.ok()) {
      CALLSCRIBE_LOG_WARN("Closing local recording failed", {StringField("path", path_), StringField("error", status.ToString())});
    }
  }
}

void LocalRecording::Append(const std::string& pcm) {
  Unwrap(out_->Write(pcm.data(), static_cast<int64_t>(pcm.size())));
  bytes_written_ += pcm.size();
}

void LocalRecording::Close() {
  if (!out_->closed()) {
    Unwrap(out_->Close());
  }
}

// ------------------------------------------------------------------
// AudioFanOut
// ------------------------------------------------------------------

AudioFanOut::AudioFanOut(std::shared_ptr<LocalRecording> recording, std::shared_ptr<AudioPipe> pipe)
    : recording_(std::move(recording)), pipe_(std::move(pipe)) {
}

void AudioFanOut::Deliver(InterleavedFrame&& frame) {
  auto pcm = frame.ToBytes();
  ++frames_;

  if (recording_) {
    try {
      recording_->Append(pcm);
    } catch (const std::exception& e) {
      CALLSCRIBE_LOG_ERROR("Local recording write failed, recording disabled",
                           {StringField("path", recording_->Path()), StringField("error", e.what())});
      recording_.reset();
    }
  }

  pipe_->Push(std::move(pcm));
}

void AudioFanOut::Close() {
  pipe_->Close();
  if (recording_) {
    try {
      recording_->Close();
    } catch (const std::exception& e) {
      CALLSCRIBE_LOG_ERROR("Closing local recording failed", {StringField("path", recording_->Path()), StringField("error", e.what())});
    }
  }
}

} // namespace callscribe::audio
