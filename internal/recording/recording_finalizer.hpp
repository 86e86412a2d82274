#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "recording_store.hpp"

namespace callscribe::recording {

struct RecordingOptions {
  std::string   raw_prefix       = "raw/";
  std::string   recording_prefix = "recordings/";
  std::string   temp_path        = "/tmp/";
  std::string   url_base;
  std::uint32_t sample_rate_hz = 8000;
};

RecordingOptions BuildRecordingOptions(const callscribe::runtime::config::RecordingConfig& config, std::uint32_t sample_rate_hz);

/*
  Moves each work unit's local raw audio into durable storage and, when the
  call ends, stitches the parts into one WAV recording.

  Everything here is best-effort: failures are logged and reported through
  the return value, never thrown. Parts stay individually available when a
  merge fails.
*/
class RecordingFinalizer {
 public:
  RecordingFinalizer(std::shared_ptr<RecordingStore> store, RecordingOptions options);

  std::string TempPath(const std::string& call_id, std::uint32_t sequence) const;
  std::string PartKey(const std::string& call_id, std::uint32_t sequence) const;
  std::string RecordingKey(const std::string& call_id) const;
  std::string RecordingUrl(const std::string& call_id) const;

  // Uploads the temp file of one work unit and removes it locally.
  bool UploadPart(const std::string& call_id, std::uint32_t sequence);

  // Merges parts 1..last_sequence; returns the recording URL on success.
  std::optional<std::string> MergeCall(const std::string& call_id, std::uint32_t last_sequence);

 private:
  void RemoveTemp(const std::string& path);

  std::shared_ptr<RecordingStore> store_;
  RecordingOptions                options_;
};

} // namespace callscribe::recording
