#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "callscribe/v1/call.pb.h"
#include "event_log.hpp"
#include "internal/speech/recognition_event.hpp"

namespace callscribe::events {

inline constexpr const char* kEventStart             = "START";
inline constexpr const char* kEventContinue          = "CONTINUE";
inline constexpr const char* kEventEnd               = "END";
inline constexpr const char* kEventError             = "ERROR";
inline constexpr const char* kEventTranscriptSegment = "ADD_TRANSCRIPT_SEGMENT";
inline constexpr const char* kEventCallCategory      = "ADD_CALL_CATEGORY";
inline constexpr const char* kEventRecordingUrl      = "ADD_RECORDING_URL";

struct EventSinkOptions {
  bool save_partial_transcripts = true;
  bool emit_continue_events     = false;
};

/*
  Turns lifecycle and recognition events into CallEventRecords (JSON) and
  appends them to the event log, partitioned by call id.

  Delivery is best-effort: a failed append is logged and dropped, never
  retried and never thrown to the caller.
*/
class EventSink {
 public:
  EventSink(std::shared_ptr<EventLog> log, EventSinkOptions options);

  void Start(const callscribe::v1::CallSession& session);
  void Continue(const callscribe::v1::CallSession& session);
  void End(const callscribe::v1::CallSession& session);
  void Error(const callscribe::v1::CallSession& session, const std::string& message);

  void Recognition(const std::string& call_id, const speech::RecognitionEvent& event);
  void RecordingUrl(const std::string& call_id, const std::string& url);

  std::uint64_t Appended() const {
    return appended_;
  }

  std::uint64_t Failed() const {
    return failed_;
  }

  std::uint64_t Suppressed() const {
    return suppressed_;
  }

 private:
  void Lifecycle(const char* event_type, const callscribe::v1::CallSession& session, const std::string& error_message);
  void Append(callscribe::v1::CallEventRecord record);

  std::shared_ptr<EventLog>  log_;
  EventSinkOptions           options_;
  std::atomic<std::uint64_t> appended_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> suppressed_{0};
};

} // namespace callscribe::events
