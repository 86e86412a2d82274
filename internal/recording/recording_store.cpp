#include "recording_store.hpp"

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>

#include <limits>
#include <stdexcept>

#include "internal/audio/wav.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace callscribe::recording {

using namespace callscribe::storage::common;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int64_t kCopyChunkBytes = 1 << 20;

uint64_t Copy(arrow::io::InputStream& in, arrow::io::OutputStream& out) {
  uint64_t copied = 0;
  while (true) {
    auto chunk = Unwrap(in.Read(kCopyChunkBytes));
    if (chunk->size() == 0) break;
    Unwrap(out.Write(chunk));
    copied += static_cast<uint64_t>(chunk->size());
  }
  return copied;
}

} // namespace

RecordingStore::RecordingStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::string RecordingStore::ObjectPath(const std::string& key) const {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw std::invalid_argument("invalid recording key: " + key);
  }
  return JoinPath(root_path_, key);
}

void RecordingStore::EnsureParent(const std::string& path) {
  auto slash = path.rfind('/');
  if (slash == std::string::npos || slash == 0) return;
  Unwrap(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true));
}

void RecordingStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto path = ObjectPath(key);
  EnsureParent(path);
  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

std::uint64_t RecordingStore::PutFile(const std::string& key, const std::string& local_path) {
  auto in   = Unwrap(arrow::io::ReadableFile::Open(local_path));
  auto path = ObjectPath(key);
  EnsureParent(path);
  auto out    = Unwrap(fs_->OpenOutputStream(path));
  auto copied = Copy(*in, *out);
  Unwrap(out->Close());
  Unwrap(in->Close());
  return copied;
}

std::shared_ptr<arrow::Buffer> RecordingStore::Get(const std::string& key) {
  return ReadAll(Unwrap(fs_->OpenInputFile(ObjectPath(key))));
}

bool RecordingStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

void RecordingStore::Remove(const std::string& key) {
  Unwrap(fs_->DeleteFile(ObjectPath(key)));
}

MergeResult RecordingStore::MergeInto(const std::string& final_key, const std::vector<std::string>& part_keys,
                                      std::uint32_t sample_rate_hz) {
  MergeResult              result;
  std::vector<std::string> present;

  for (const auto& key : part_keys) {
    auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
    if (info.type() != arrow::fs::FileType::File) {
      CALLSCRIBE_LOG_WARN("Recording part missing, skipped", {StringField("key", key), StringField("final_key", final_key)});
      ++result.parts_missing;
      continue;
    }
    result.data_bytes += static_cast<uint64_t>(info.size());
    present.push_back(key);
  }

  if (result.data_bytes > std::numeric_limits<uint32_t>::max() - audio::kWavHeaderBytes) {
    throw std::runtime_error("merged recording exceeds the WAV size limit: " + final_key);
  }

  auto path = ObjectPath(final_key);
  EnsureParent(path);
  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(audio::WavHeader(sample_rate_hz, 2, 16, static_cast<uint32_t>(result.data_bytes))));

  for (const auto& key : present) {
    auto in = Unwrap(fs_->OpenInputStream(ObjectPath(key)));
    Copy(*in, *out);
    Unwrap(in->Close());
    ++result.parts_merged;
  }
  Unwrap(out->Close());

  CALLSCRIBE_LOG_INFO("Recording merged", {StringField("final_key", final_key), IntField("parts", result.parts_merged),
                                           IntField("missing", result.parts_missing), IntField("bytes", result.data_bytes)});
  return result;
}

} // namespace callscribe::recording
