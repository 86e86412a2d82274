#include "demuxer.hpp"

#include <cstdlib>
#include <thread>

#include "ebml_ids.hpp"
#include "fragment_marker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::media {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kMaxConsecutiveReadFailures = 3;

std::uint64_t ReadUnsigned(std::string_view data) {
  std::uint64_t value = 0;
  for (char c : data.substr(0, 8)) {
    value = (value << 8) | static_cast<std::uint8_t>(c);
  }
  return value;
}

std::optional<double> ParseSeconds(const std::string& text) {
  char*        end   = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (text.empty() || !end || *end != '\0') return std::nullopt;
  return value;
}

} // namespace

Demuxer::Demuxer(DemuxerOptions options, ChunkSink sink)
    : options_(std::move(options)), sink_(std::move(sink)), reader_(options_.max_element_bytes) {
  resuming_ = !options_.resume_after.empty();
  if (resuming_) {
    last_fragment_ = options_.resume_after;
  }
}

DemuxResult Demuxer::Run(ByteStream& stream, const std::atomic<bool>& stop) {
  const auto channel   = std::string(audio::ToString(options_.channel));
  auto       last_data = std::chrono::steady_clock::now();
  int        failures  = 0;

  while (true) {
    std::optional<std::string> bytes;
    try {
      bytes    = stream.Read(options_.read_chunk_bytes, options_.poll_interval);
      failures = 0;
    } catch (const util::TransientError& e) {
      if (++failures >= kMaxConsecutiveReadFailures) throw;
      CALLSCRIBE_LOG_WARN("Media read failed, retrying", {StringField("channel", channel), IntField("attempt", failures),
                                                          StringField("error", e.what())});
      std::this_thread::sleep_for(options_.poll_interval);
      continue;
    }

    if (!bytes) {
      stats_.end = DemuxEnd::kEndOfStream;
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    if (bytes->empty()) {
      if (stop.load()) {
        stats_.end = DemuxEnd::kStopped;
        stream.Close();
        break;
      }
      if (now - last_data >= options_.inactivity_timeout) {
        CALLSCRIBE_LOG_WARN("Media source inactive, closing", {StringField("channel", channel), StringField("last_fragment", last_fragment_)});
        stats_.end = DemuxEnd::kInactivity;
        stream.Close();
        break;
      }
      continue;
    }

    last_data = now;
    if (!Consume(*bytes, stop.load())) {
      stats_.end = DemuxEnd::kStopped;
      stream.Close();
      break;
    }
  }

  for (const auto& event : reader_.Finish()) {
    HandleEvent(event, false);
  }

  stats_.last_fragment = last_fragment_;
  CALLSCRIBE_LOG_INFO("Demuxer finished", {StringField("channel", channel), StringField("last_fragment", last_fragment_),
                                           IntField("chunks", static_cast<int64_t>(stats_.chunks_emitted)),
                                           IntField("forwarded", static_cast<int64_t>(stats_.chunks_forwarded)),
                                           IntField("suppressed", static_cast<int64_t>(stats_.chunks_suppressed)),
                                           IntField("decode_errors", static_cast<int64_t>(stats_.decode_errors))});
  return stats_;
}

bool Demuxer::Consume(std::string_view bytes, bool stop_requested) {
  if (stop_reached_) return false;
  reader_.Feed(bytes);
  while (auto event = reader_.Next()) {
    if (!HandleEvent(*event, stop_requested)) {
      stop_reached_ = true;
      return false;
    }
  }
  return true;
}

void Demuxer::AcceptForwarded(audio::AudioChunk&& chunk) {
  chunk.channel = options_.channel;
  sink_(std::move(chunk));
}

StreamTimestamps Demuxer::Timestamps() const {
  std::lock_guard lock(timestamps_mutex_);
  return timestamps_;
}

bool Demuxer::HandleEvent(const EbmlEvent& event, bool stop_requested) {
  switch (event.kind) {
    case EbmlEvent::Kind::kDecodeError:
      DecodeFailure(event.data);
      return true;

    case EbmlEvent::Kind::kMasterStart:
      if (event.id == ebml::kTrackEntry) {
        entry_number_ = 0;
        entry_name_.clear();
      } else if (event.id == ebml::kCluster) {
        cluster_timecode_ = 0;
      } else if (event.id == ebml::kSimpleTag) {
        tag_name_.clear();
        tag_string_.clear();
      }
      return true;

    case EbmlEvent::Kind::kMasterEnd:
      if (event.id == ebml::kTrackEntry) {
        OnTrackEntryEnd();
      } else if (event.id == ebml::kSimpleTag) {
        return OnSimpleTag(stop_requested);
      } else if (event.id == ebml::kSegment && stop_requested) {
        return false;
      }
      return true;

    case EbmlEvent::Kind::kLeaf:
      switch (event.id) {
        case ebml::kTimecodeScale:
          timecode_scale_ns_ = ReadUnsigned(event.data);
          if (timecode_scale_ns_ == 0) timecode_scale_ns_ = 1000000;
          break;
        case ebml::kTrackNumber:
          entry_number_ = ReadUnsigned(event.data);
          break;
        case ebml::kName:
          entry_name_ = event.data;
          break;
        case ebml::kTimecode:
          cluster_timecode_ = ReadUnsigned(event.data);
          break;
        case ebml::kTagName:
          tag_name_ = event.data;
          break;
        case ebml::kTagString:
          tag_string_ = event.data;
          break;
        case ebml::kSimpleBlock:
        case ebml::kBlock:
          OnBlock(event.data);
          break;
        default:
          break;
      }
      return true;
  }
  return true;
}

void Demuxer::OnTrackEntryEnd() {
  if (entry_number_ == 0) return;
  auto role = options_.track_roles.find(entry_name_);
  if (role == options_.track_roles.end()) {
    tracks_.erase(entry_number_);
    return;
  }
  tracks_[entry_number_] = role->second;
  CALLSCRIBE_LOG_DEBUG("Track mapped", {IntField("track", static_cast<int64_t>(entry_number_)), StringField("name", entry_name_),
                                        StringField("role", audio::ToString(role->second))});
}

bool Demuxer::OnSimpleTag(bool stop_requested) {
  if (tag_name_ == options_.fragment_tag_name) {
    // a new fragment starts; with the stop flag set it belongs to the successor
    if (stop_requested) return false;

    if (resuming_) {
      // fragments up to the checkpoint were delivered by the predecessor
      if (CompareFragmentMarkers(tag_string_, options_.resume_after) <= 0) return true;
      resuming_ = false;
      CALLSCRIBE_LOG_INFO("Resumed after fragment", {StringField("channel", audio::ToString(options_.channel)),
                                                      StringField("resume_after", options_.resume_after),
                                                      StringField("fragment", tag_string_)});
    }
    last_fragment_ = tag_string_;
    return true;
  }

  if (tag_name_ == kProducerTimestampTag || tag_name_ == kServerTimestampTag) {
    auto seconds = ParseSeconds(tag_string_);
    if (!seconds) return true;
    std::lock_guard lock(timestamps_mutex_);
    if (tag_name_ == kProducerTimestampTag) {
      timestamps_.producer = seconds;
    } else {
      timestamps_.server = seconds;
    }
  }
  return true;
}

/*
  Block layout: track number (EBML vint), signed 16-bit timecode relative to
  the cluster, flags byte, then the frame payload.
*/
void Demuxer::OnBlock(std::string_view block) {
  if (block.empty()) {
    DecodeFailure("empty block");
    return;
  }

  const auto  first  = static_cast<std::uint8_t>(block[0]);
  std::size_t length = 1;
  for (std::uint8_t mask = 0x80; length <= 8 && (first & mask) == 0; mask >>= 1) ++length;
  if (length > 8 || block.size() < length + 3) {
    DecodeFailure("truncated block header");
    return;
  }

  std::uint64_t track = first & static_cast<std::uint8_t>(0xFF >> length);
  for (std::size_t i = 1; i < length; ++i) {
    track = (track << 8) | static_cast<std::uint8_t>(block[i]);
  }

  const auto relative = static_cast<std::int16_t>(static_cast<std::uint16_t>((static_cast<std::uint8_t>(block[length]) << 8) |
                                                                             static_cast<std::uint8_t>(block[length + 1])));
  const auto flags = static_cast<std::uint8_t>(block[length + 2]);
  if ((flags & 0x06) != 0) {
    DecodeFailure("laced block on track " + std::to_string(track));
    return;
  }

  if (resuming_) {
    ++stats_.chunks_suppressed;
    return;
  }

  const std::string_view payload = block.substr(length + 3);
  if (payload.size() % 2 != 0) {
    DecodeFailure("odd-sized PCM payload on track " + std::to_string(track));
  }

  audio::AudioChunk chunk;
  auto              role = tracks_.find(track);
  chunk.channel          = role == tracks_.end() ? options_.channel : role->second;
  const auto ticks       = static_cast<std::int64_t>(cluster_timecode_) + relative;
  chunk.timestamp_us     = ticks * static_cast<std::int64_t>(timecode_scale_ns_) / 1000;
  chunk.fragment         = last_fragment_;
  chunk.samples          = audio::DecodePcm16(payload);
  if (chunk.samples.empty()) return;

  if (chunk.channel == options_.channel) {
    ++stats_.chunks_emitted;
    sink_(std::move(chunk));
    return;
  }
  if (sibling_) {
    ++stats_.chunks_forwarded;
    sibling_->AcceptForwarded(std::move(chunk));
  }
}

void Demuxer::DecodeFailure(const std::string& what) {
  ++stats_.decode_errors;
  CALLSCRIBE_LOG_WARN("Skipping malformed media element", {StringField("channel", audio::ToString(options_.channel)),
                                                            StringField("error", what)});
}

} // namespace callscribe::media
