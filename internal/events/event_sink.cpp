#include "event_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace callscribe::events {

using callscribe::v1::CallEventRecord;
using callscribe::v1::CallSession;
using observability::StringField;

namespace {

callscribe::v1::ChannelRole ToRole(audio::Channel channel) {
  return channel == audio::Channel::kCaller ? callscribe::v1::CHANNEL_ROLE_CALLER : callscribe::v1::CHANNEL_ROLE_AGENT;
}

} // namespace

EventSink::EventSink(std::shared_ptr<EventLog> log, EventSinkOptions options) : log_(std::move(log)), options_(options) {
}

void EventSink::Start(const CallSession& session) {
  Lifecycle(kEventStart, session, {});
}

void EventSink::Continue(const CallSession& session) {
  if (!options_.emit_continue_events) return;
  Lifecycle(kEventContinue, session, {});
}

void EventSink::End(const CallSession& session) {
  Lifecycle(kEventEnd, session, {});
}

void EventSink::Error(const CallSession& session, const std::string& message) {
  Lifecycle(kEventError, session, message);
}

void EventSink::Lifecycle(const char* event_type, const CallSession& session, const std::string& error_message) {
  CallEventRecord record;
  record.set_event_type(event_type);
  record.set_call_id(session.call_id());

  auto* lifecycle = record.mutable_lifecycle();
  lifecycle->set_from_number(session.from_number());
  lifecycle->set_to_number(session.to_number());
  lifecycle->set_agent_id(session.agent_id());
  lifecycle->set_metadata_json(session.metadata_json());
  lifecycle->set_error_message(error_message);
  lifecycle->set_work_unit_sequence(session.work_unit_sequence());

  Append(std::move(record));
}

void EventSink::Recognition(const std::string& call_id, const speech::RecognitionEvent& event) {
  CallEventRecord record;
  record.set_call_id(call_id);

  const bool keep = std::visit(
      [&](const auto& e) -> bool {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, speech::CategoryMatch>) {
          record.set_event_type(kEventCallCategory);
          auto* match = record.mutable_category_match();
          match->set_category(e.category);
          match->set_rule_id(e.rule_id);
          for (const auto& [begin, end] : e.ranges) {
            auto* range = match->add_ranges();
            range->set_begin_offset_ms(begin);
            range->set_end_offset_ms(end);
          }
          return true;
        } else {
          if (e.is_partial && !options_.save_partial_transcripts) return false;
          record.set_event_type(kEventTranscriptSegment);
          auto* segment = record.mutable_transcript_segment();
          segment->set_channel(ToRole(e.channel));
          segment->set_segment_id(e.segment_id);
          segment->set_start_time(e.start_time);
          segment->set_end_time(e.end_time);
          segment->set_text(e.text);
          segment->set_is_partial(e.is_partial);
          if constexpr (std::is_same_v<T, speech::Utterance>) {
            segment->set_utterance(true);
            segment->set_sentiment(e.sentiment);
          }
          return true;
        }
      },
      event);

  if (!keep) {
    ++suppressed_;
    return;
  }
  Append(std::move(record));
}

void EventSink::RecordingUrl(const std::string& call_id, const std::string& url) {
  CallEventRecord record;
  record.set_event_type(kEventRecordingUrl);
  record.set_call_id(call_id);
  record.mutable_recording_url()->set_url(url);
  Append(std::move(record));
}

void EventSink::Append(CallEventRecord record) {
  *record.mutable_created_at() = util::ToProto(util::Now());

  try {
    std::string                               json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    auto status                        = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
      throw std::runtime_error("serialize call event: " + status.ToString());
    }

    log_->Append(record.call_id(), json);
    ++appended_;
  } catch (const std::exception& e) {
    ++failed_;
    CALLSCRIBE_LOG_ERROR("Dropping call event", {StringField("call_id", record.call_id()), StringField("event_type", record.event_type()),
                                                 StringField("error", e.what())});
  }
}

} // namespace callscribe::events
