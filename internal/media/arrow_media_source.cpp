#include "arrow_media_source.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::media {

using callscribe::storage::common::JoinPath;
using callscribe::storage::common::Unwrap;
using observability::StringField;

ArrowMediaSource::ArrowMediaSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, ArrowMediaSourceOptions options)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), options_(options) {
}

std::unique_ptr<ByteStream> ArrowMediaSource::Open(const std::string& source_id, const std::string& resume_marker) {
  if (source_id.empty()) {
    throw std::invalid_argument("media source id must not be empty");
  }
  const auto path = JoinPath(root_path_, source_id);

  auto info = fs_->GetFileInfo(path);
  if (!info.ok()) {
    throw util::TransientError("media source " + source_id + ": " + info.status().ToString());
  }
  if (info->type() == arrow::fs::FileType::NotFound && !options_.follow) {
    throw util::NotFound("media source " + source_id + " does not exist");
  }

  // objects cannot be entered mid-way; the demuxer skips up to the marker
  CALLSCRIBE_LOG_INFO("Opening media source", {StringField("source", source_id), StringField("path", path),
                                               StringField("resume_after", resume_marker.empty() ? "-" : resume_marker)});
  return std::make_unique<ArrowByteStream>(fs_, path, options_);
}

// ------------------------------------------------------------------
// ArrowByteStream
// ------------------------------------------------------------------

ArrowByteStream::ArrowByteStream(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path, ArrowMediaSourceOptions options)
    : fs_(std::move(fs)), path_(std::move(path)), options_(options) {
}

std::optional<std::string> ArrowByteStream::Read(std::size_t max_bytes, std::chrono::milliseconds wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;

  while (!closed_) {
    if (offset_ < known_size_ || Refresh()) {
      const auto n      = std::min<int64_t>(static_cast<int64_t>(max_bytes), known_size_ - offset_);
      auto       buffer = Unwrap(file_->ReadAt(offset_, n));
      offset_ += buffer->size();
      return buffer->ToString();
    }

    if (!options_.follow || SourceClosed()) {
      // a last refresh so bytes written just before the marker are not lost
      if (Refresh()) continue;
      return std::nullopt;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::string();
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options_.poll_interval, deadline - now));
  }
  return std::nullopt;
}

void ArrowByteStream::Close() {
  closed_ = true;
}

bool ArrowByteStream::Refresh() {
  auto info = fs_->GetFileInfo(path_);
  if (!info.ok()) {
    throw util::TransientError("media source " + path_ + ": " + info.status().ToString());
  }
  if (info->type() != arrow::fs::FileType::File || info->size() <= known_size_) {
    return false;
  }
  // remote objects fix their length at open, so reopen to see appended bytes
  file_       = Unwrap(fs_->OpenInputFile(*info));
  known_size_ = info->size();
  return offset_ < known_size_;
}

bool ArrowByteStream::SourceClosed() const {
  auto info = fs_->GetFileInfo(path_ + ".closed");
  return info.ok() && info->type() == arrow::fs::FileType::File;
}

} // namespace callscribe::media
