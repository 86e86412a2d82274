#include "session_driver.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::speech {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kIdentifyLanguage = "identify-language";

} // namespace

SessionDriverOptions BuildDriverOptions(const callscribe::runtime::config::SpeechConfig& config, std::uint32_t sample_rate_hz,
                                        const std::string& resume_session_id) {
  SessionDriverOptions options;
  options.start_attempts = config.start_attempts();
  options.start_backoff  = std::chrono::milliseconds(config.start_backoff_ms());

  auto& session             = options.session;
  session.sample_rate_hz    = sample_rate_hz;
  session.channel_count     = 2;
  session.resume_session_id = resume_session_id;
  if (config.start_timeout_ms() > 0) session.start_timeout = std::chrono::milliseconds(config.start_timeout_ms());
  session.analytics         = config.analytics_mode();

  if (config.language_code() == kIdentifyLanguage) {
    session.language_code.clear();
    session.identify_language  = true;
    session.language_options   = config.language_options();
    session.preferred_language = config.preferred_language();
  } else {
    session.language_code = config.language_code();
  }

  // the service only redacts en-US
  if (config.content_redaction().enabled() && session.language_code == "en-US") {
    session.content_redaction_type = config.content_redaction().type();
    session.pii_entity_types       = config.content_redaction().pii_entity_types();
    session.post_call_redaction_output =
        config.content_redaction().post_call_output().empty() ? "redacted" : config.content_redaction().post_call_output();
  }
  session.vocabulary_name     = config.vocabulary_name();
  session.language_model_name = config.language_model_name();

  session.post_call_analytics        = config.post_call_analytics().enabled();
  session.post_call_output_location  = config.post_call_analytics().output_location();
  session.post_call_data_access_role = config.post_call_analytics().data_access_role();
  return options;
}

SessionDriver::SessionDriver(std::shared_ptr<SpeechClient> client, SessionDriverOptions options, EventHandler handler)
    : client_(std::move(client)), options_(std::move(options)), handler_(std::move(handler)) {
}

std::string SessionDriver::Start() {
  const std::uint32_t attempts = options_.start_attempts == 0 ? 1 : options_.start_attempts;

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      stream_     = client_->Start(options_.session);
      session_id_ = stream_->SessionId().empty() ? options_.session.resume_session_id : stream_->SessionId();
      CALLSCRIBE_LOG_INFO("Recognition session started", {StringField("session_id", session_id_), IntField("attempt", attempt),
                                                          observability::BoolField("resumed", !options_.session.resume_session_id.empty()),
                                                          observability::BoolField("analytics", options_.session.analytics)});
      return session_id_;
    } catch (const util::TransientError& e) {
      if (attempt >= attempts) {
        CALLSCRIBE_LOG_ERROR("Recognition session start failed, giving up", {IntField("attempts", attempt), StringField("error", e.what())});
        throw;
      }
      CALLSCRIBE_LOG_WARN("Recognition session start failed, retrying", {IntField("attempt", attempt), StringField("error", e.what())});
      std::this_thread::sleep_for(options_.start_backoff);
    }
  }
}

void SessionDriver::Run(audio::AudioPipe& pipe) {
  if (!stream_) {
    throw util::InvalidState("recognition session not started");
  }

  std::thread pusher(&SessionDriver::PushAudio, this, std::ref(pipe));

  callscribe::speech::v1::RecognizeResponse response;
  while (stream_->Read(&response)) {
    for (const auto& event : Classify(response)) {
      if (!finality_.Admit(event)) {
        ++events_rejected_;
        continue;
      }
      ++events_delivered_;
      handler_(event);
    }
    response.Clear();
  }

  pusher.join();

  try {
    stream_->Finish();
  } catch (const std::exception& e) {
    stream_failed_ = true;
    CALLSCRIBE_LOG_ERROR("Recognition session ended with error", {StringField("session_id", session_id_), StringField("error", e.what())});
  }

  CALLSCRIBE_LOG_INFO("Recognition session finished", {StringField("session_id", session_id_),
                                                       IntField("packets", static_cast<int64_t>(packets_sent_.load())),
                                                       IntField("events", static_cast<int64_t>(events_delivered_)),
                                                       IntField("rejected", static_cast<int64_t>(events_rejected_))});
}

void SessionDriver::PushAudio(audio::AudioPipe& pipe) {
  bool broken = false;
  while (auto pcm = pipe.Pop()) {
    if (broken) continue;
    if (!stream_->WriteAudio(*pcm)) {
      broken         = true;
      stream_failed_ = true;
      CALLSCRIBE_LOG_WARN("Recognition stream rejected audio, draining locally", {StringField("session_id", session_id_)});
      continue;
    }
    ++packets_sent_;
  }
  if (!broken) {
    stream_->WritesDone();
  }
}

} // namespace callscribe::speech
