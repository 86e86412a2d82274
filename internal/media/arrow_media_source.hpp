#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "media_source.hpp"

namespace callscribe::media {

struct ArrowMediaSourceOptions {
  // Keep polling an object past its current end, as with a live stream.
  bool                      follow = false;
  std::chrono::milliseconds poll_interval{200};
};

/*
  Media source backed by an Arrow filesystem.

  Source ids are object keys below the root. In follow mode a growing object
  is read like a live stream; it ends once a "<key>.closed" marker object
  exists and every byte has been read.
*/
class ArrowMediaSource final : public MediaSource {
 public:
  ArrowMediaSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, ArrowMediaSourceOptions options);

  std::unique_ptr<ByteStream> Open(const std::string& source_id, const std::string& resume_marker) override;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  ArrowMediaSourceOptions                options_;
};

class ArrowByteStream final : public ByteStream {
 public:
  ArrowByteStream(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path, ArrowMediaSourceOptions options);

  std::optional<std::string> Read(std::size_t max_bytes, std::chrono::milliseconds wait) override;
  void                       Close() override;

 private:
  // true when new bytes became visible
  bool Refresh();
  bool SourceClosed() const;

  std::shared_ptr<arrow::fs::FileSystem>       fs_;
  std::string                                  path_;
  ArrowMediaSourceOptions                      options_;
  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  int64_t                                      offset_     = 0;
  int64_t                                      known_size_ = 0;
  std::atomic<bool>                            closed_{false};
};

} // namespace callscribe::media
