#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ebml_reader.hpp"
#include "internal/audio/audio_types.hpp"
#include "media_source.hpp"

namespace callscribe::media {

inline constexpr const char* kFragmentNumberTag    = "AWS_KINESISVIDEO_FRAGMENT_NUMBER";
inline constexpr const char* kProducerTimestampTag = "AWS_KINESISVIDEO_PRODUCER_TIMESTAMP";
inline constexpr const char* kServerTimestampTag   = "AWS_KINESISVIDEO_SERVER_TIMESTAMP";

struct DemuxerOptions {
  audio::Channel channel = audio::Channel::kCaller;
  // track name -> channel; unmapped tracks belong to `channel`
  std::map<std::string, audio::Channel> track_roles;
  std::string                           fragment_tag_name = kFragmentNumberTag;
  // non-empty: suppress audio until a fragment after this marker starts
  std::string               resume_after;
  std::size_t               read_chunk_bytes = 64 * 1024;
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds inactivity_timeout{5 * 60 * 1000};
  std::size_t               max_element_bytes = 4 * 1024 * 1024;
};

enum class DemuxEnd {
  kEndOfStream,
  kInactivity,
  kStopped,
};

struct DemuxResult {
  DemuxEnd      end = DemuxEnd::kEndOfStream;
  std::string   last_fragment;
  std::uint64_t chunks_emitted    = 0;
  std::uint64_t chunks_forwarded  = 0;
  std::uint64_t chunks_suppressed = 0;
  std::uint64_t decode_errors     = 0;
};

// Stream-side wall clock tags, in seconds since the epoch.
struct StreamTimestamps {
  std::optional<double> producer;
  std::optional<double> server;
};

using ChunkSink = std::function<void(audio::AudioChunk&&)>;

/*
  Extracts one channel's audio from a Matroska byte stream.

  Blocks belonging to the other party's track are handed to the sibling
  demuxer, which covers sources carrying both parties on separate tracks.
  The stop flag is honoured only at fragment boundaries so a successor can
  resume exactly after the last fully delivered fragment.
*/
class Demuxer {
 public:
  Demuxer(DemuxerOptions options, ChunkSink sink);

  Demuxer(const Demuxer&)            = delete;
  Demuxer& operator=(const Demuxer&) = delete;

  void SetSibling(Demuxer* sibling) {
    sibling_ = sibling;
  }

  // Reads until end of stream, inactivity, or the stop flag at a fragment boundary.
  DemuxResult Run(ByteStream& stream, const std::atomic<bool>& stop);

  // Parses a slice of the stream. false once a stop boundary has been reached.
  bool Consume(std::string_view bytes, bool stop_requested);

  // Chunk for this demuxer's channel found by the sibling.
  void AcceptForwarded(audio::AudioChunk&& chunk);

  audio::Channel Channel() const {
    return options_.channel;
  }

  const std::string& LastFragment() const {
    return last_fragment_;
  }

  StreamTimestamps Timestamps() const;

  const DemuxResult& Stats() const {
    return stats_;
  }

 private:
  bool HandleEvent(const EbmlEvent& event, bool stop_requested);
  bool OnSimpleTag(bool stop_requested);
  void OnBlock(std::string_view block);
  void OnTrackEntryEnd();
  void DecodeFailure(const std::string& what);

  DemuxerOptions options_;
  ChunkSink      sink_;
  Demuxer*       sibling_ = nullptr;
  EbmlReader     reader_;

  std::unordered_map<std::uint64_t, audio::Channel> tracks_;
  std::uint64_t                                     entry_number_ = 0;
  std::string                                       entry_name_;
  std::string                                       tag_name_;
  std::string                                       tag_string_;

  std::uint64_t timecode_scale_ns_ = 1000000;
  std::uint64_t cluster_timecode_  = 0;

  std::string last_fragment_;
  bool        resuming_     = false;
  bool        stop_reached_ = false;
  DemuxResult stats_;

  mutable std::mutex timestamps_mutex_;
  StreamTimestamps   timestamps_;
};

} // namespace callscribe::media
