#include "internal/speech/session_driver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "internal/speech/recognition_event.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

namespace pb = callscribe::speech::v1;

using callscribe::audio::AudioPipe;
using callscribe::audio::Channel;
using callscribe::speech::CategoryMatch;
using callscribe::speech::Classify;
using callscribe::speech::FinalityTracker;
using callscribe::speech::RecognitionEvent;
using callscribe::speech::SessionDriver;
using callscribe::speech::SessionDriverOptions;
using callscribe::speech::TranscriptSegment;
using callscribe::speech::Utterance;
using namespace callscribe::testing;

SessionDriverOptions FastOptions() {
  SessionDriverOptions options;
  options.start_attempts = 3;
  options.start_backoff  = std::chrono::milliseconds(1);
  return options;
}

void TestTranscriptResultsBecomeSegments() {
  auto response = FinalTranscript("ch_1", 1.5, "hello there");
  auto* empty   = response.mutable_transcript_event()->add_results();
  empty->set_channel_id("ch_0");
  empty->add_alternatives();

  const auto events = Classify(response);
  assert(events.size() == 1);
  const auto& segment = std::get<TranscriptSegment>(events[0]);
  assert(segment.channel == Channel::kAgent);
  assert(segment.segment_id == "ch_1-1.5");
  assert(segment.text == "hello there");
  assert(!segment.is_partial);
  assert(segment.end_time == 2.5);
}

void TestUtteranceAndCategoryEvents() {
  pb::RecognizeResponse utterance_response;
  auto*                 u = utterance_response.mutable_utterance_event();
  u->set_utterance_id("u-1");
  u->set_participant_role("CUSTOMER");
  u->set_begin_offset_millis(1500);
  u->set_end_offset_millis(2250);
  u->set_transcript("my card was declined");
  u->set_sentiment("NEGATIVE");

  auto events = Classify(utterance_response);
  assert(events.size() == 1);
  const auto& utterance = std::get<Utterance>(events[0]);
  assert(utterance.channel == Channel::kCaller);
  assert(utterance.start_time == 1.5 && utterance.end_time == 2.25);
  assert(utterance.sentiment == "NEGATIVE");

  pb::RecognizeResponse category_response;
  auto*                 c = category_response.mutable_category_event();
  c->add_matched_categories("billing");
  c->add_matched_categories("escalation");
  auto& details = (*c->mutable_matched_details())["billing"];
  details.set_rule_id("rule-7");
  auto* range = details.add_timestamp_ranges();
  range->set_begin_offset_millis(100);
  range->set_end_offset_millis(900);

  events = Classify(category_response);
  assert(events.size() == 2);
  const auto& billing = std::get<CategoryMatch>(events[0]);
  assert(billing.rule_id == "rule-7");
  assert(billing.ranges.size() == 1 && billing.ranges[0].second == 900);
  const auto& escalation = std::get<CategoryMatch>(events[1]);
  assert(escalation.rule_id == "escalation");
  assert(escalation.ranges.empty());

  pb::RecognizeResponse started;
  started.mutable_session_started()->set_session_id("s");
  assert(Classify(started).empty());
}

void TestFinalityIsMonotonic() {
  FinalityTracker tracker;
  const auto      partial = Classify(FinalTranscript("ch_0", 3, "hel", true));
  const auto      final   = Classify(FinalTranscript("ch_0", 3, "hello"));

  assert(tracker.Admit(partial[0]));
  assert(tracker.Admit(final[0]));
  // neither a late partial nor a repeated final passes once final
  assert(!tracker.Admit(partial[0]));
  assert(!tracker.Admit(final[0]));
  assert(tracker.FinalCount() == 1);

  CategoryMatch match;
  match.category = "billing";
  assert(tracker.Admit(RecognitionEvent(match)));
  assert(tracker.Admit(RecognitionEvent(match)));
}

void TestCloseFinalsKeepDistinctSegments() {
  FinalityTracker tracker;
  const auto      first  = Classify(FinalTranscript("ch_0", 1234.561, "first sentence"));
  const auto      second = Classify(FinalTranscript("ch_0", 1234.564, "second sentence"));

  const auto& a = std::get<TranscriptSegment>(first[0]);
  const auto& b = std::get<TranscriptSegment>(second[0]);
  assert(a.segment_id != b.segment_id);
  assert(tracker.Admit(first[0]));
  assert(tracker.Admit(second[0]));
  assert(tracker.FinalCount() == 2);

  // a service-assigned result id names the segment
  auto response = FinalTranscript("ch_0", 1234.561, "first sentence");
  response.mutable_transcript_event()->mutable_results(0)->set_result_id("res-42");
  const auto named = Classify(response);
  assert(std::get<TranscriptSegment>(named[0]).segment_id == "res-42");
}

void TestDriverOptionsFromConfig() {
  callscribe::runtime::config::SpeechConfig config;
  config.set_language_code("en-US");
  config.mutable_content_redaction()->set_enabled(true);
  config.mutable_content_redaction()->set_type("PII");
  config.mutable_content_redaction()->set_pii_entity_types("NAME,ADDRESS");
  config.set_start_attempts(4);
  config.set_start_backoff_ms(250);
  config.set_start_timeout_ms(750);

  auto options = callscribe::speech::BuildDriverOptions(config, 16000, "resume-1");
  assert(options.start_attempts == 4);
  assert(options.start_backoff == std::chrono::milliseconds(250));
  assert(options.session.start_timeout == std::chrono::milliseconds(750));
  assert(options.session.sample_rate_hz == 16000);
  assert(options.session.resume_session_id == "resume-1");
  assert(options.session.content_redaction_type == "PII");
  assert(options.session.post_call_redaction_output == "redacted");

  const auto start = callscribe::speech::BuildStartSession(options.session);
  assert(start.language_code() == "en-US");
  assert(start.session_id() == "resume-1");
  assert(start.pii_entity_types() == "NAME,ADDRESS");
  assert(start.enable_channel_identification());
  assert(!callscribe::speech::BuildConfiguration(options.session).has_value());

  // redaction only applies to en-US; language identification has no fixed language
  config.set_language_code("identify-language");
  config.set_language_options("en-US,es-US");
  config.set_analytics_mode(true);
  options = callscribe::speech::BuildDriverOptions(config, 8000, "");
  assert(options.session.identify_language);
  assert(options.session.content_redaction_type.empty());

  const auto identify = callscribe::speech::BuildStartSession(options.session);
  assert(identify.identify_language());
  assert(identify.language_options() == "en-US,es-US");
  assert(identify.language_code().empty());
  assert(!identify.enable_channel_identification());

  const auto configuration = callscribe::speech::BuildConfiguration(options.session);
  assert(configuration.has_value());
  assert(configuration->channel_definitions_size() == 2);
  assert(configuration->channel_definitions(0).participant_role() == "CUSTOMER");
}

void TestStartRetriesTransientFailures() {
  auto client = std::make_shared<FakeSpeechClient>();
  client->FailStarts(2);

  SessionDriver driver(client, FastOptions(), [](const RecognitionEvent&) {});
  assert(driver.Start() == "session-1");
  assert(client->State()->starts.size() == 3);
}

void TestStartGivesUpAfterLastAttempt() {
  auto client = std::make_shared<FakeSpeechClient>();
  client->FailStarts(5);

  SessionDriver driver(client, FastOptions(), [](const RecognitionEvent&) {});
  bool          threw = false;
  try {
    driver.Start();
  } catch (const callscribe::util::TransientError&) {
    threw = true;
  }
  assert(threw);
  assert(client->State()->starts.size() == 3);
}

void TestResumedSessionKeepsCallLevelId() {
  auto client = std::make_shared<FakeSpeechClient>();
  client->AssignSessionId("");

  auto options                      = FastOptions();
  options.session.resume_session_id = "call-session-9";
  SessionDriver driver(client, options, [](const RecognitionEvent&) {});
  assert(driver.Start() == "call-session-9");
  assert(client->State()->starts[0].resume_session_id == "call-session-9");
}

void TestRunStreamsAudioAndDeliversEvents() {
  auto client = std::make_shared<FakeSpeechClient>();
  client->Respond({FinalTranscript("ch_0", 0, "hi", true), FinalTranscript("ch_0", 0, "hi there"), FinalTranscript("ch_0", 0, "hi", true),
                   FinalTranscript("ch_1", 0.5, "hello")});

  std::vector<RecognitionEvent> delivered;
  SessionDriver driver(client, FastOptions(), [&](const RecognitionEvent& event) { delivered.push_back(event); });
  driver.Start();

  AudioPipe   pipe(16, std::chrono::milliseconds(10));
  std::thread producer([&] {
    for (int i = 0; i < 5; ++i) pipe.Push(std::string(3200, '\x01'));
    pipe.Close();
  });
  driver.Run(pipe);
  producer.join();

  assert(driver.PacketsSent() == 5);
  assert(client->State()->packets == 5);
  assert(client->State()->writes_done == 1);
  assert(delivered.size() == 3);
  assert(driver.EventsRejected() == 1);
  assert(!driver.StreamFailed());
}

void TestFinishFailureIsReportedNotThrown() {
  auto client = std::make_shared<FakeSpeechClient>();
  client->FailFinish(true);

  SessionDriver driver(client, FastOptions(), [](const RecognitionEvent&) {});
  driver.Start();

  AudioPipe pipe(4, std::chrono::milliseconds(10));
  pipe.Push(std::string(320, '\0'));
  pipe.Close();
  driver.Run(pipe);
  assert(driver.StreamFailed());
}

void TestRunBeforeStartIsRejected() {
  auto          client = std::make_shared<FakeSpeechClient>();
  SessionDriver driver(client, FastOptions(), [](const RecognitionEvent&) {});
  AudioPipe     pipe(1, std::chrono::milliseconds(1));

  bool threw = false;
  try {
    driver.Run(pipe);
  } catch (const callscribe::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTranscriptResultsBecomeSegments();
  TestUtteranceAndCategoryEvents();
  TestFinalityIsMonotonic();
  TestCloseFinalsKeepDistinctSegments();
  TestDriverOptionsFromConfig();
  TestStartRetriesTransientFailures();
  TestStartGivesUpAfterLastAttempt();
  TestResumedSessionKeepsCallLevelId();
  TestRunStreamsAudioAndDeliversEvents();
  TestFinishFailureIsReportedNotThrown();
  TestRunBeforeStartIsRejected();

  std::cout << "callscribe_unit_speech_session: pass\n";
  return 0;
}
