#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "callscribe/speech/v1/recognizer.pb.h"

namespace callscribe::speech {

struct SessionConfig {
  std::string   language_code  = "en-US";
  std::uint32_t sample_rate_hz = 8000;
  std::uint32_t channel_count  = 2;
  // set on continuation so the service treats this as the same call-level session
  std::string resume_session_id;
  // how long Start waits for the service to confirm the session
  std::chrono::milliseconds start_timeout{10000};

  bool        analytics = false;
  std::string content_redaction_type;
  std::string pii_entity_types;
  std::string vocabulary_name;
  std::string language_model_name;

  bool        identify_language = false;
  std::string language_options;
  std::string preferred_language;

  bool        post_call_analytics = false;
  std::string post_call_output_location;
  std::string post_call_data_access_role;
  std::string post_call_redaction_output;
};

callscribe::speech::v1::StartSession BuildStartSession(const SessionConfig& config);

// The one-time analytics configuration; std::nullopt outside analytics mode.
std::optional<callscribe::speech::v1::Configuration> BuildConfiguration(const SessionConfig& config);

/*
  One open streaming recognition session. Writes and reads may run on
  different threads; each side is used by one thread only.
*/
class RecognitionStream {
 public:
  virtual ~RecognitionStream() = default;

  virtual const std::string& SessionId() const = 0;

  // false once the stream is broken
  virtual bool WriteAudio(const std::string& pcm) = 0;

  // Half-closes the input so the service finalizes pending results.
  virtual void WritesDone() = 0;

  // false at end of results
  virtual bool Read(callscribe::speech::v1::RecognizeResponse* response) = 0;

  // Final status; throws when the session ended abnormally.
  virtual void Finish() = 0;
};

class SpeechClient {
 public:
  virtual ~SpeechClient() = default;

  // Throws util::TransientError when the session could not be opened.
  virtual std::unique_ptr<RecognitionStream> Start(const SessionConfig& config) = 0;
};

} // namespace callscribe::speech
