#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace callscribe::recording {

struct MergeResult {
  std::uint32_t parts_merged  = 0;
  std::uint32_t parts_missing = 0;
  std::uint64_t data_bytes    = 0;
};

/*
  Durable object storage for raw work-unit audio and merged recordings,
  backed by any Arrow filesystem (local, S3, GCS...).

  Keys are relative to the store root:

      <root_path>/<key>
*/
class RecordingStore {
 public:
  RecordingStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer);

  // Streams a local file into the store without loading it whole.
  std::uint64_t PutFile(const std::string& key, const std::string& local_path);

  std::shared_ptr<arrow::Buffer> Get(const std::string& key);
  bool                           Exists(const std::string& key);
  void                           Remove(const std::string& key);

  /*
    Writes a WAV object made of a 44-byte RIFF header (16-bit stereo PCM at
    sample_rate_hz) followed by the parts, in the order given. Missing parts
    are skipped.
  */
  MergeResult MergeInto(const std::string& final_key, const std::vector<std::string>& part_keys, std::uint32_t sample_rate_hz);

  const std::string& RootPath() const {
    return root_path_;
  }

 private:
  std::string ObjectPath(const std::string& key) const;
  void        EnsureParent(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace callscribe::recording
