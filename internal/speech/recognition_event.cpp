#include "recognition_event.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace callscribe::speech {

namespace {

namespace pb = callscribe::speech::v1;

// Round-trip precision: results a few milliseconds apart late in a call must not collide.
std::string FormatTime(double seconds) {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << seconds;
  return out.str();
}

void ClassifyTranscript(const pb::TranscriptEvent& event, std::vector<RecognitionEvent>& out) {
  for (const auto& result : event.results()) {
    if (result.alternatives_size() == 0 || result.alternatives(0).transcript().empty()) continue;

    TranscriptSegment segment;
    segment.channel    = result.channel_id() == "ch_0" ? audio::Channel::kCaller : audio::Channel::kAgent;
    segment.segment_id =
        result.result_id().empty() ? result.channel_id() + "-" + FormatTime(result.start_time()) : result.result_id();
    segment.start_time = result.start_time();
    segment.end_time   = result.end_time();
    segment.text       = result.alternatives(0).transcript();
    segment.is_partial = result.is_partial();
    out.emplace_back(std::move(segment));
  }
}

void ClassifyUtterance(const pb::UtteranceEvent& event, std::vector<RecognitionEvent>& out) {
  if (event.transcript().empty()) return;

  Utterance utterance;
  utterance.channel    = event.participant_role() == "CUSTOMER" ? audio::Channel::kCaller : audio::Channel::kAgent;
  utterance.segment_id = event.utterance_id();
  utterance.start_time = static_cast<double>(event.begin_offset_millis()) / 1000.0;
  utterance.end_time   = static_cast<double>(event.end_offset_millis()) / 1000.0;
  utterance.text       = event.transcript();
  utterance.is_partial = event.is_partial();
  utterance.sentiment  = event.sentiment();
  out.emplace_back(std::move(utterance));
}

void ClassifyCategory(const pb::CategoryEvent& event, std::vector<RecognitionEvent>& out) {
  for (const auto& category : event.matched_categories()) {
    CategoryMatch match;
    match.category = category;
    match.rule_id  = category;

    auto details = event.matched_details().find(category);
    if (details != event.matched_details().end()) {
      if (!details->second.rule_id().empty()) match.rule_id = details->second.rule_id();
      for (const auto& range : details->second.timestamp_ranges()) {
        match.ranges.emplace_back(range.begin_offset_millis(), range.end_offset_millis());
      }
    }
    out.emplace_back(std::move(match));
  }
}

} // namespace

std::vector<RecognitionEvent> Classify(const pb::RecognizeResponse& response) {
  std::vector<RecognitionEvent> events;
  switch (response.response_case()) {
    case pb::RecognizeResponse::kTranscriptEvent:
      ClassifyTranscript(response.transcript_event(), events);
      break;
    case pb::RecognizeResponse::kUtteranceEvent:
      ClassifyUtterance(response.utterance_event(), events);
      break;
    case pb::RecognizeResponse::kCategoryEvent:
      ClassifyCategory(response.category_event(), events);
      break;
    case pb::RecognizeResponse::kSessionStarted:
    case pb::RecognizeResponse::RESPONSE_NOT_SET:
      break;
  }
  return events;
}

bool FinalityTracker::Admit(const RecognitionEvent& event) {
  return std::visit(
      [this](const auto& e) -> bool {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, CategoryMatch>) {
          return true;
        } else {
          if (finals_.count(e.segment_id) > 0) return false;
          if (!e.is_partial) finals_.insert(e.segment_id);
          return true;
        }
      },
      event);
}

} // namespace callscribe::speech
