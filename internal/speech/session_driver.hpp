#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/audio/audio_pipe.hpp"
#include "recognition_event.hpp"
#include "speech_client.hpp"

namespace callscribe::speech {

struct SessionDriverOptions {
  SessionConfig             session;
  std::uint32_t             start_attempts = 3;
  std::chrono::milliseconds start_backoff{1000};
};

// Translates the speech config section into a session request.
SessionDriverOptions BuildDriverOptions(const callscribe::runtime::config::SpeechConfig& config, std::uint32_t sample_rate_hz,
                                        const std::string& resume_session_id);

using EventHandler = std::function<void(const RecognitionEvent&)>;

/*
  Drives one streaming recognition session for a work unit.

  Start() opens the session (retrying transient failures). Run() then pushes
  interleaved audio from the pipe on a helper thread while this thread reads
  and classifies results; it returns once the pipe is closed and the service
  has delivered its final results. A session that breaks mid-call is logged
  and the pipe keeps draining so ingestion and recording continue.
*/
class SessionDriver {
 public:
  SessionDriver(std::shared_ptr<SpeechClient> client, SessionDriverOptions options, EventHandler handler);

  // Throws util::TransientError once every attempt failed.
  std::string Start();

  void Run(audio::AudioPipe& pipe);

  const std::string& SessionId() const {
    return session_id_;
  }

  std::uint64_t PacketsSent() const {
    return packets_sent_;
  }

  std::uint64_t EventsDelivered() const {
    return events_delivered_;
  }

  std::uint64_t EventsRejected() const {
    return events_rejected_;
  }

  bool StreamFailed() const {
    return stream_failed_;
  }

 private:
  void PushAudio(audio::AudioPipe& pipe);

  std::shared_ptr<SpeechClient>      client_;
  SessionDriverOptions               options_;
  EventHandler                       handler_;
  std::unique_ptr<RecognitionStream> stream_;
  std::string                        session_id_;
  FinalityTracker                    finality_;

  std::atomic<std::uint64_t> packets_sent_{0};
  std::uint64_t              events_delivered_ = 0;
  std::uint64_t              events_rejected_  = 0;
  std::atomic<bool>          stream_failed_{false};
};

} // namespace callscribe::speech
