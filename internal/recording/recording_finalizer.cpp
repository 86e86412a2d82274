#include "recording_finalizer.hpp"

#include <arrow/filesystem/localfs.h>

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace callscribe::recording {

using observability::IntField;
using observability::StringField;

RecordingOptions BuildRecordingOptions(const callscribe::runtime::config::RecordingConfig& config, std::uint32_t sample_rate_hz) {
  RecordingOptions options;
  options.raw_prefix       = config.raw_prefix();
  options.recording_prefix = config.recording_prefix();
  options.temp_path        = config.temp_path();
  options.url_base         = config.url_base();
  options.sample_rate_hz   = sample_rate_hz;
  return options;
}

RecordingFinalizer::RecordingFinalizer(std::shared_ptr<RecordingStore> store, RecordingOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
}

std::string RecordingFinalizer::TempPath(const std::string& call_id, std::uint32_t sequence) const {
  storage::common::ValidateKeyComponent(call_id);
  return options_.temp_path + call_id + "-" + std::to_string(sequence) + ".raw";
}

std::string RecordingFinalizer::PartKey(const std::string& call_id, std::uint32_t sequence) const {
  storage::common::ValidateKeyComponent(call_id);
  return options_.raw_prefix + call_id + "-" + std::to_string(sequence) + ".raw";
}

std::string RecordingFinalizer::RecordingKey(const std::string& call_id) const {
  storage::common::ValidateKeyComponent(call_id);
  return options_.recording_prefix + call_id + ".wav";
}

std::string RecordingFinalizer::RecordingUrl(const std::string& call_id) const {
  return options_.url_base + RecordingKey(call_id);
}

bool RecordingFinalizer::UploadPart(const std::string& call_id, std::uint32_t sequence) {
  try {
    const auto temp = TempPath(call_id, sequence);
    const auto key  = PartKey(call_id, sequence);
    const auto size = store_->PutFile(key, temp);
    CALLSCRIBE_LOG_INFO("Recording part uploaded", {StringField("call_id", call_id), IntField("sequence", sequence),
                                                    StringField("key", key), IntField("bytes", size)});
    RemoveTemp(temp);
    return true;
  } catch (const std::exception& e) {
    CALLSCRIBE_LOG_ERROR("Recording part upload failed",
                         {StringField("call_id", call_id), IntField("sequence", sequence), StringField("error", e.what())});
    return false;
  }
}

std::optional<std::string> RecordingFinalizer::MergeCall(const std::string& call_id, std::uint32_t last_sequence) {
  try {
    std::vector<std::string> parts;
    parts.reserve(last_sequence);
    for (std::uint32_t seq = 1; seq <= last_sequence; ++seq) {
      parts.push_back(PartKey(call_id, seq));
    }

    auto result = store_->MergeInto(RecordingKey(call_id), parts, options_.sample_rate_hz);
    if (result.parts_merged == 0) {
      CALLSCRIBE_LOG_WARN("No recording parts to merge", {StringField("call_id", call_id)});
    }

    for (const auto& key : parts) {
      try {
        if (store_->Exists(key)) store_->Remove(key);
      } catch (const std::exception& e) {
        CALLSCRIBE_LOG_WARN("Removing merged recording part failed", {StringField("key", key), StringField("error", e.what())});
      }
    }
    return RecordingUrl(call_id);
  } catch (const std::exception& e) {
    CALLSCRIBE_LOG_ERROR("Recording merge failed", {StringField("call_id", call_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

void RecordingFinalizer::RemoveTemp(const std::string& path) {
  arrow::fs::LocalFileSystem local;
  auto                       status = local.DeleteFile(path);
  if (!status.ok()) {
    CALLSCRIBE_LOG_WARN("Removing local recording failed", {StringField("path", path), StringField("error", status.ToString())});
  }
}

} // namespace callscribe::recording
