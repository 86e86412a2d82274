#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

#include "callscribe/speech/v1/recognizer.pb.h"
#include "internal/audio/audio_types.hpp"

namespace callscribe::speech {

struct TranscriptSegment {
  audio::Channel channel = audio::Channel::kCaller;
  std::string    segment_id;
  double         start_time = 0;
  double         end_time   = 0;
  std::string    text;
  bool           is_partial = false;
};

// Analytics-mode utterance; carries sentiment once final.
struct Utterance {
  audio::Channel channel = audio::Channel::kCaller;
  std::string    segment_id;
  double         start_time = 0;
  double         end_time   = 0;
  std::string    text;
  bool           is_partial = false;
  std::string    sentiment;
};

struct CategoryMatch {
  std::string category;
  std::string rule_id;
  // [begin, end) offsets into the call, in milliseconds
  std::vector<std::pair<std::int64_t, std::int64_t>> ranges;
};

using RecognitionEvent = std::variant<TranscriptSegment, Utterance, CategoryMatch>;

// Splits one service response into events; results without text are dropped.
std::vector<RecognitionEvent> Classify(const callscribe::speech::v1::RecognizeResponse& response);

/*
  Enforces monotonic finality: once a segment id has been delivered final,
  every later event with that id is rejected.
*/
class FinalityTracker {
 public:
  bool Admit(const RecognitionEvent& event);

  std::size_t FinalCount() const {
    return finals_.size();
  }

 private:
  std::unordered_set<std::string> finals_;
};

} // namespace callscribe::speech
